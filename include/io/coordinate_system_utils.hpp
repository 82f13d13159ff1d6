#ifndef IOTRANS_COORDINATE_SYSTEM_UTILS_HPP
#define IOTRANS_COORDINATE_SYSTEM_UTILS_HPP

#include <string>
#include <ogr_api.h>
#include <ogr_spatialref.h>

namespace iotrans {
namespace io {

/**
 * Coordinate system utility functions for EPSG-based reprojection
 */
class CoordinateSystemUtils {
public:
    /**
     * Create a spatial reference from an EPSG code, with longitude/easting first
     * @param epsg EPSG code
     * @return Spatial reference handle (caller owns the handle), or nullptr if the code is unknown
     */
    static OGRSpatialReferenceH createSpatialReference(int epsg);

    /**
     * Create coordinate transformation between two EPSG codes
     * @param source_epsg Source EPSG code
     * @param target_epsg Target EPSG code
     * @return Coordinate transformation handle (caller owns the handle), or nullptr on failure
     */
    static OGRCoordinateTransformationH createTransformation(int source_epsg, int target_epsg);

private:
    // Disable instantiation
    CoordinateSystemUtils() = delete;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_COORDINATE_SYSTEM_UTILS_HPP
