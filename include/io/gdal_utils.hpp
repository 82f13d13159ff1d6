#ifndef IOTRANS_GDAL_UTILS_HPP
#define IOTRANS_GDAL_UTILS_HPP

#include <string>
#include <ogr_core.h>
#include "core/config.hpp"

namespace iotrans {
namespace io {

/**
 * GDAL utility functions for driver lookup and schema type mapping
 */
class GDALUtils {
public:
    /**
     * Register all GDAL drivers (once per process)
     */
    static void registerDrivers();

    /**
     * Check if a specific GDAL driver is available and supports creation
     * @param driver_name GDAL driver name
     * @return true if driver is available and supports creation, false otherwise
     */
    static bool isDriverAvailable(const std::string& driver_name);

    /**
     * Map a geometry type name ("MultiPolygon", "3D MultiPoint", ...) to an OGR geometry type
     * @param geometry_type Geometry type name
     * @return OGR geometry type, wkbUnknown for unrecognized names
     */
    static OGRwkbGeometryType geometryTypeFromName(const std::string& geometry_type);

    /**
     * Map a writer attribute type to an OGR field type
     * @param field_type Writer attribute type
     * @return OGR field type
     */
    static OGRFieldType toOGRFieldType(SpatialFieldType field_type);

private:
    // Disable instantiation
    GDALUtils() = delete;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_GDAL_UTILS_HPP
