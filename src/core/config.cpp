#include "core/config.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <boost/filesystem.hpp>
#include <fstream>
#include <sstream>

namespace iotrans {

const ConversionTables& ConversionTables::defaults() {
    static const ConversionTables tables = [] {
        ConversionTables t;

        t.ogr_drivers = {
            {"shp", "ESRI Shapefile"},
            {"geojson", "GeoJSON"},
            {"gpkg", "GPKG"},
        };

        t.field_types = {
            {"text", SpatialFieldType::STRING},
            {"date", SpatialFieldType::STRING},
            {"timestamp", SpatialFieldType::STRING},
            {"time", SpatialFieldType::STRING},
            {"float", SpatialFieldType::REAL},
            {"numeric", SpatialFieldType::REAL},
            {"int", SpatialFieldType::INTEGER64},
        };

        t.multi_geometry_types = {
            {"Point", "MultiPoint"},
            {"LineString", "MultiLineString"},
            {"Polygon", "MultiPolygon"},
            {"3D Point", "3D MultiPoint"},
            {"3D LineString", "3D MultiLineString"},
            {"3D Polygon", "3D MultiPolygon"},
            // Already multi
            {"MultiPoint", "MultiPoint"},
            {"MultiLineString", "MultiLineString"},
            {"MultiPolygon", "MultiPolygon"},
            {"3D MultiPoint", "3D MultiPoint"},
            {"3D MultiLineString", "3D MultiLineString"},
            {"3D MultiPolygon", "3D MultiPolygon"},
            // Collections are never wrapped
            {"GeometryCollection", "GeometryCollection"},
            {"3D GeometryCollection", "3D GeometryCollection"},
        };

        t.spatial_formats = {"shp", "geojson", "gpkg", "csv"};
        t.non_spatial_formats = {"csv", "json", "xml"};
        return t;
    }();
    return tables;
}

std::optional<SpatialFieldType> ConversionTables::fieldTypeFor(const std::string& semantic_type) const {
    std::string base;
    base.reserve(semantic_type.size());
    for (char c : semantic_type) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            base += c;
        }
    }

    auto it = field_types.find(base);
    if (it == field_types.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> ConversionTables::multiGeometryType(const std::string& geometry_type) const {
    auto it = multi_geometry_types.find(geometry_type);
    if (it == multi_geometry_types.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> ConversionTables::driverFor(const std::string& format) const {
    auto it = ogr_drivers.find(format);
    if (it == ogr_drivers.end()) {
        return std::nullopt;
    }
    return it->second;
}

EngineConfig::EngineConfig()
    : storage_path(boost::filesystem::temp_directory_path().string()),
      page_size(20000),
      xml_chunk_size(5000),
      allowed_epsgs{4326, 2952},
      continue_on_handler_error(false),
      keep_cache(false),
      verbose(false) {}

EngineConfig parseEngineConfig(const nlohmann::json& config_json) {
    EngineConfig config;

    if (!config_json.is_object()) {
        throw ValidationError("Engine configuration must be a JSON object");
    }

    try {
        if (config_json.contains("storage_path")) {
            config.storage_path = config_json["storage_path"].get<std::string>();
        }
        if (config_json.contains("page_size")) {
            config.page_size = config_json["page_size"].get<size_t>();
        }
        if (config_json.contains("xml_chunk_size")) {
            config.xml_chunk_size = config_json["xml_chunk_size"].get<size_t>();
        }
        if (config_json.contains("allowed_epsgs")) {
            config.allowed_epsgs = config_json["allowed_epsgs"].get<std::set<int>>();
        }
        if (config_json.contains("continue_on_handler_error")) {
            config.continue_on_handler_error = config_json["continue_on_handler_error"].get<bool>();
        }
        if (config_json.contains("keep_cache")) {
            config.keep_cache = config_json["keep_cache"].get<bool>();
        }
        if (config_json.contains("verbose")) {
            config.verbose = config_json["verbose"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("Invalid engine configuration: " + std::string(e.what()));
    }

    if (config.page_size == 0) {
        throw ValidationError("Invalid engine configuration: page_size must be positive");
    }
    if (config.xml_chunk_size == 0) {
        throw ValidationError("Invalid engine configuration: xml_chunk_size must be positive");
    }

    return config;
}

EngineConfig loadEngineConfig(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ValidationError("Failed to open configuration file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json config_json;
    try {
        config_json = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("JSON parse error in " + file_path + ": " + e.what());
    }

    return parseEngineConfig(config_json);
}

} // namespace iotrans
