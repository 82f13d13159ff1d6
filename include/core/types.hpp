#ifndef IOTRANS_TYPES_HPP
#define IOTRANS_TYPES_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace iotrans {

// Records keep their field order and value types through the whole pipeline
using Json = nlohmann::ordered_json;
using Record = Json;

// Reserved field holding the geometry payload of spatial datasets
inline constexpr const char* GEOMETRY_FIELD = "geometry";

// Epsg slot used in result keys of non-spatial outputs
inline constexpr const char* NO_EPSG = "None";

/**
 * One column of a dataset as reported by the record source
 */
struct FieldInfo {
    std::string id;      // Field name
    std::string type;    // Semantic type (text, date, timestamp, float4, int8, numeric, time...)

    FieldInfo() = default;
    FieldInfo(std::string field_id, std::string field_type)
        : id(std::move(field_id)), type(std::move(field_type)) {}
};

/**
 * Resource-level metadata (display name and whether the backing store is queryable)
 */
struct ResourceInfo {
    std::string name;
    bool datastore_active;

    ResourceInfo() : datastore_active(false) {}
};

/**
 * Everything a format handler needs to know about the dataset it serializes
 */
struct DatasetMetadata {
    std::string name;                            // Used for output file names
    std::vector<FieldInfo> fields;               // Ordered field list
    std::optional<std::string> geometry_type;    // Sampled base geometry type (spatial only)

    std::vector<std::string> fieldIds() const {
        std::vector<std::string> ids;
        ids.reserve(fields.size());
        for (const auto& field : fields) {
            ids.push_back(field.id);
        }
        return ids;
    }

    bool isSpatial() const {
        for (const auto& field : fields) {
            if (field.id == GEOMETRY_FIELD) {
                return true;
            }
        }
        return false;
    }
};

/**
 * Spatial request shape: every target format is produced once per target EPSG
 */
struct SpatialRequest {
    std::string resource_id;
    int source_epsg;
    std::vector<int> target_epsgs;
    std::vector<std::string> target_formats;

    SpatialRequest() : source_epsg(0) {}
};

/**
 * Non-spatial request shape: one output per target format
 */
struct NonSpatialRequest {
    std::string resource_id;
    std::vector<std::string> target_formats;
};

using ConversionRequest = std::variant<SpatialRequest, NonSpatialRequest>;

inline bool isSpatialRequest(const ConversionRequest& request) {
    return std::holds_alternative<SpatialRequest>(request);
}

inline const std::string& requestResourceId(const ConversionRequest& request) {
    if (const auto* spatial = std::get_if<SpatialRequest>(&request)) {
        return spatial->resource_id;
    }
    return std::get<NonSpatialRequest>(request).resource_id;
}

/**
 * Outcome of one conversion request
 */
struct ConversionResult {
    std::map<std::string, std::string> outputs;   // "{format}-{epsg|None}" -> absolute path
    std::map<std::string, std::string> failures;  // handler name -> error (only with continue_on_handler_error)
    std::string working_directory;                // Request-scoped directory under the storage root
    size_t record_count;

    ConversionResult() : record_count(0) {}
};

/**
 * Build the result key for a format and optional target EPSG
 */
inline std::string resultKey(const std::string& format, const std::optional<int>& epsg) {
    return format + "-" + (epsg.has_value() ? std::to_string(epsg.value()) : std::string(NO_EPSG));
}

/**
 * Dataset name usable as a single file name component (path separators become "_")
 */
inline std::string fileSafeName(const std::string& name) {
    std::string safe = name;
    for (auto& c : safe) {
        if (c == '/' || c == '\\') {
            c = '_';
        }
    }
    return safe;
}

} // namespace iotrans

#endif // IOTRANS_TYPES_HPP
