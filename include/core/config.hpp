#ifndef IOTRANS_CONFIG_HPP
#define IOTRANS_CONFIG_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace iotrans {

/**
 * Attribute types understood by the spatial writers
 */
enum class SpatialFieldType {
    STRING,
    REAL,
    INTEGER64
};

/**
 * Immutable lookup tables shared by the factory, handlers and geometry stage
 */
struct ConversionTables {
    std::map<std::string, std::string> ogr_drivers;                 // Spatial format -> GDAL driver name
    std::map<std::string, SpatialFieldType> field_types;            // Semantic type (digits stripped) -> writer type
    std::map<std::string, std::string> multi_geometry_types;        // Geometry type -> Multi equivalent
    std::set<std::string> spatial_formats;                          // shp, geojson, gpkg, csv
    std::set<std::string> non_spatial_formats;                      // csv, json, xml

    /**
     * Tables matching the platform's data store type vocabulary
     * @return Shared immutable instance
     */
    static const ConversionTables& defaults();

    /**
     * Map a semantic field type to a writer type, ignoring width digits (float4 -> float)
     * @param semantic_type Field type as reported by the record source
     * @return Writer type, or nullopt if the type has no mapping
     */
    std::optional<SpatialFieldType> fieldTypeFor(const std::string& semantic_type) const;

    /**
     * Multi-part equivalent of a geometry type name
     * @param geometry_type GeoJSON geometry type name
     * @return Multi type name, or nullopt if the type is unknown
     */
    std::optional<std::string> multiGeometryType(const std::string& geometry_type) const;

    /**
     * GDAL driver for a spatial format
     * @param format Spatial target format
     * @return Driver name, or nullopt if the format is not written through GDAL
     */
    std::optional<std::string> driverFor(const std::string& format) const;
};

/**
 * Engine configuration
 */
struct EngineConfig {
    std::string storage_path;               // Root for request directories; prune is confined to it
    size_t page_size;                       // Records per record-source page
    size_t xml_chunk_size;                  // Rows buffered before each XML disk write
    std::set<int> allowed_epsgs;            // EPSG codes accepted in requests
    bool continue_on_handler_error;         // Record a failed handler and keep going instead of aborting
    bool keep_cache;                        // Leave the JSON-lines cache in the request directory
    bool verbose;                           // Progress output on stdout

    EngineConfig();
};

/**
 * Parse an engine configuration from JSON; absent keys keep their defaults
 * @param config_json JSON object
 * @return Engine configuration
 * @throws ValidationError if a key has the wrong type
 */
EngineConfig parseEngineConfig(const nlohmann::json& config_json);

/**
 * Load an engine configuration from a JSON file
 * @param file_path Path to the configuration file
 * @return Engine configuration
 * @throws ValidationError if the file cannot be read or parsed
 */
EngineConfig loadEngineConfig(const std::string& file_path);

} // namespace iotrans

#endif // IOTRANS_CONFIG_HPP
