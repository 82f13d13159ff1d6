#include "geometry/geometry_transform.hpp"
#include "core/errors.hpp"
#include "io/coordinate_system_utils.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace iotrans {
namespace geometry {

namespace {

const std::string THREE_D_PREFIX = "3D ";

bool isNullText(const std::string& text) {
    std::string trimmed = text;
    trimmed.erase(trimmed.begin(), std::find_if(trimmed.begin(), trimmed.end(),
                  [](unsigned char c) { return !std::isspace(c); }));
    trimmed.erase(std::find_if(trimmed.rbegin(), trimmed.rend(),
                  [](unsigned char c) { return !std::isspace(c); }).base(), trimmed.end());
    return trimmed.empty() || trimmed == "null" || trimmed == "None";
}

// [0,0] and [null,null] are placeholders for "no location", not real points
bool isZeroPosition(const Json& coordinates) {
    return coordinates.is_array() && coordinates.size() == 2 &&
           coordinates[0].is_number() && coordinates[1].is_number() &&
           coordinates[0].get<double>() == 0.0 && coordinates[1].get<double>() == 0.0;
}

bool isNullPosition(const Json& coordinates) {
    return coordinates.is_array() && coordinates.size() == 2 &&
           coordinates[0].is_null() && coordinates[1].is_null();
}

std::string stripDimensionPrefix(const std::string& type_name) {
    if (type_name.compare(0, THREE_D_PREFIX.size(), THREE_D_PREFIX) == 0) {
        return type_name.substr(THREE_D_PREFIX.size());
    }
    return type_name;
}

} // namespace

OgrReprojector::OgrReprojector(int source_epsg, int target_epsg)
    : coord_trans_(io::CoordinateSystemUtils::createTransformation(source_epsg, target_epsg)) {
    if (!coord_trans_) {
        throw IoError("Failed to create coordinate transformation from EPSG:" +
                      std::to_string(source_epsg) + " to EPSG:" + std::to_string(target_epsg));
    }
}

OgrReprojector::~OgrReprojector() {
    if (coord_trans_) {
        OCTDestroyCoordinateTransformation(coord_trans_);
    }
}

bool OgrReprojector::transform(double& x, double& y, double& z) {
    return OCTTransform(coord_trans_, 1, &x, &y, &z) == TRUE;
}

GeometryTransformer::GeometryTransformer(const ConversionTables& tables, std::unique_ptr<Reprojector> reprojector)
    : tables_(tables), reprojector_(std::move(reprojector)), reprojected_count_(0) {}

Json GeometryTransformer::parseGeometry(const Json& value) {
    if (value.is_null()) {
        return Json();
    }

    if (value.is_object()) {
        return value;
    }

    if (value.is_string()) {
        const std::string& text = value.get_ref<const std::string&>();
        if (isNullText(text)) {
            return Json();
        }
        Json parsed;
        try {
            parsed = Json::parse(text);
        } catch (const Json::parse_error& e) {
            throw SchemaError("Geometry is not valid JSON: " + std::string(e.what()));
        }
        if (parsed.is_null()) {
            return Json();
        }
        if (!parsed.is_object()) {
            throw SchemaError("Geometry must be a JSON object: " + text);
        }
        return parsed;
    }

    throw SchemaError("Unsupported geometry value: " + value.dump());
}

Json GeometryTransformer::transform(const Json& value) {
    Json geometry = parseGeometry(value);
    if (geometry.is_null()) {
        return geometry;
    }
    return transformGeometry(geometry, true);
}

void GeometryTransformer::transformRecord(Record& record) {
    if (!record.contains(GEOMETRY_FIELD)) {
        record[GEOMETRY_FIELD] = Json();
        return;
    }
    record[GEOMETRY_FIELD] = transform(record[GEOMETRY_FIELD]);
}

Json GeometryTransformer::transformGeometry(const Json& geometry, bool promote) {
    if (!geometry.contains("type") || !geometry["type"].is_string()) {
        throw SchemaError("Geometry without a type: " + geometry.dump());
    }

    const std::string type_name = geometry["type"].get<std::string>();
    std::optional<std::string> multi_type = tables_.multiGeometryType(type_name);
    if (!multi_type) {
        throw SchemaError("Unknown geometry type: " + type_name);
    }

    Json result = Json::object();

    if (stripDimensionPrefix(type_name) == "GeometryCollection") {
        if (!geometry.contains("geometries") || !geometry["geometries"].is_array()) {
            throw SchemaError("GeometryCollection without geometries: " + geometry.dump());
        }
        result["type"] = "GeometryCollection";
        result["geometries"] = Json::array();
        for (const auto& member : geometry["geometries"]) {
            if (!member.is_object()) {
                throw SchemaError("GeometryCollection member must be an object: " + member.dump());
            }
            result["geometries"].push_back(transformGeometry(member, false));
        }
        return result;
    }

    if (!geometry.contains("coordinates") || !geometry["coordinates"].is_array()) {
        throw SchemaError("Geometry without coordinates: " + geometry.dump());
    }

    Json coordinates = geometry["coordinates"];
    const bool is_single = promote && multi_type.value() != type_name;

    if (is_single) {
        result["type"] = stripDimensionPrefix(multi_type.value());
        if (isZeroPosition(coordinates)) {
            result["coordinates"] = Json::array({coordinates});
            return result;
        }
        if (isNullPosition(coordinates)) {
            result["coordinates"] = Json::array();
            return result;
        }
        reprojectCoordinates(coordinates);
        result["coordinates"] = Json::array({std::move(coordinates)});
        return result;
    }

    result["type"] = stripDimensionPrefix(type_name);
    reprojectCoordinates(coordinates);
    result["coordinates"] = std::move(coordinates);
    return result;
}

void GeometryTransformer::reprojectCoordinates(Json& coordinates) {
    if (!coordinates.is_array()) {
        throw SchemaError("Invalid coordinates: " + coordinates.dump());
    }
    if (coordinates.empty()) {
        return;
    }

    // A position is an array of numbers; anything else nests further
    if (!coordinates[0].is_array()) {
        reprojectPosition(coordinates);
        return;
    }
    for (auto& child : coordinates) {
        reprojectCoordinates(child);
    }
}

void GeometryTransformer::reprojectPosition(Json& position) {
    if (position.size() < 2) {
        throw SchemaError("Position needs at least two ordinates: " + position.dump());
    }
    for (const auto& ordinate : position) {
        if (!ordinate.is_number()) {
            throw SchemaError("Position ordinates must be numbers: " + position.dump());
        }
    }

    if (!reprojector_) {
        return;
    }

    double x = position[0].get<double>();
    double y = position[1].get<double>();
    double z = position.size() > 2 ? position[2].get<double>() : 0.0;

    if (!reprojector_->transform(x, y, z)) {
        throw SchemaError("Failed to reproject position: " + position.dump());
    }
    ++reprojected_count_;

    position[0] = x;
    position[1] = y;
    if (position.size() > 2) {
        position[2] = z;
    }
}

std::string GeometryTransformer::geometryToText(const Json& geometry) {
    if (geometry.is_null()) {
        return "";
    }
    std::string text = geometry.dump();
    std::replace(text.begin(), text.end(), '(', '[');
    std::replace(text.begin(), text.end(), ')', ']');
    return text;
}

} // namespace geometry
} // namespace iotrans
