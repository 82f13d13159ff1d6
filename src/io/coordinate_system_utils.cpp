#include "io/coordinate_system_utils.hpp"
#include <iostream>

namespace iotrans {
namespace io {

OGRSpatialReferenceH CoordinateSystemUtils::createSpatialReference(int epsg) {
    OGRSpatialReferenceH srs = OSRNewSpatialReference(nullptr);
    if (OSRImportFromEPSG(srs, epsg) != OGRERR_NONE) {
        OSRDestroySpatialReference(srs);
        return nullptr;
    }

    // Set axis mapping strategy for GDAL 3+
    OSRSetAxisMappingStrategy(srs, OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

OGRCoordinateTransformationH CoordinateSystemUtils::createTransformation(int source_epsg, int target_epsg) {
    OGRSpatialReferenceH source_srs = createSpatialReference(source_epsg);
    if (!source_srs) {
        std::cerr << "Warning: Unknown source EPSG code " << source_epsg << std::endl;
        return nullptr;
    }

    OGRSpatialReferenceH target_srs = createSpatialReference(target_epsg);
    if (!target_srs) {
        std::cerr << "Warning: Unknown target EPSG code " << target_epsg << std::endl;
        OSRDestroySpatialReference(source_srs);
        return nullptr;
    }

    OGRCoordinateTransformationH coord_trans = OCTNewCoordinateTransformation(source_srs, target_srs);

    // Clean up spatial references
    OSRDestroySpatialReference(source_srs);
    OSRDestroySpatialReference(target_srs);

    return coord_trans;
}

} // namespace io
} // namespace iotrans
