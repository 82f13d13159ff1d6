#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <gdal_priv.h>
#include <cstring>
#include <iostream>
#include <map>
#include <mutex>

namespace iotrans {
namespace io {

void GDALUtils::registerDrivers() {
    static std::once_flag registered;
    std::call_once(registered, [] { GDALAllRegister(); });
}

bool GDALUtils::isDriverAvailable(const std::string& driver_name) {
    registerDrivers();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name.c_str());
    if (!driver) {
        std::cerr << "Warning: GDAL driver '" << driver_name << "' is not available." << std::endl;
        return false;
    }

    // Check if the driver supports creation
    const char* creation_support = driver->GetMetadataItem(GDAL_DCAP_CREATE);
    if (!creation_support || strcmp(creation_support, "YES") != 0) {
        std::cerr << "Warning: GDAL driver '" << driver_name << "' does not support creation." << std::endl;
        return false;
    }

    return true;
}

OGRwkbGeometryType GDALUtils::geometryTypeFromName(const std::string& geometry_type) {
    static const std::map<std::string, OGRwkbGeometryType> geometry_types = {
        {"Point", wkbPoint},
        {"LineString", wkbLineString},
        {"Polygon", wkbPolygon},
        {"MultiPoint", wkbMultiPoint},
        {"MultiLineString", wkbMultiLineString},
        {"MultiPolygon", wkbMultiPolygon},
        {"GeometryCollection", wkbGeometryCollection},
        {"3D Point", wkbPoint25D},
        {"3D LineString", wkbLineString25D},
        {"3D Polygon", wkbPolygon25D},
        {"3D MultiPoint", wkbMultiPoint25D},
        {"3D MultiLineString", wkbMultiLineString25D},
        {"3D MultiPolygon", wkbMultiPolygon25D},
        {"3D GeometryCollection", wkbGeometryCollection25D},
    };

    auto it = geometry_types.find(geometry_type);
    return it == geometry_types.end() ? wkbUnknown : it->second;
}

OGRFieldType GDALUtils::toOGRFieldType(SpatialFieldType field_type) {
    switch (field_type) {
        case SpatialFieldType::REAL:
            return OFTReal;
        case SpatialFieldType::INTEGER64:
            return OFTInteger64;
        case SpatialFieldType::STRING:
        default:
            return OFTString;
    }
}

} // namespace io
} // namespace iotrans
