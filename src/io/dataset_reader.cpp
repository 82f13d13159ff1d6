#include "io/dataset_reader.hpp"
#include "core/errors.hpp"
#include <boost/filesystem.hpp>
#include <fstream>
#include <map>
#include <sstream>

namespace iotrans {
namespace io {

std::string DatasetReader::last_error_ = "";

MemoryDataset DatasetReader::readFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        setError("Failed to open file: " + filepath);
        throw ValidationError(last_error_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    try {
        return readFromString(buffer.str(), boost::filesystem::path(filepath).stem().string());
    } catch (const ValidationError& e) {
        setError("Error reading file " + filepath + ": " + e.what());
        throw ValidationError(last_error_);
    }
}

MemoryDataset DatasetReader::readFromString(const std::string& json_string, const std::string& default_name) {
    Json document;
    try {
        document = Json::parse(json_string);
    } catch (const Json::parse_error& e) {
        setError("JSON parse error: " + std::string(e.what()));
        throw ValidationError(last_error_);
    }

    if (!document.is_object()) {
        setError("Dataset document must be a JSON object");
        throw ValidationError(last_error_);
    }

    MemoryDataset dataset;
    dataset.resource.name = document.value("name", default_name);
    dataset.resource.datastore_active = document.value("datastore_active", true);

    try {
        if (document.contains("type") && document["type"] == "FeatureCollection") {
            parseFeatureCollection(document, dataset);
        } else {
            parseTable(document, dataset);
        }
    } catch (const Json::exception& e) {
        setError("Invalid dataset document: " + std::string(e.what()));
        throw ValidationError(last_error_);
    }

    return dataset;
}

void DatasetReader::parseTable(const Json& document, MemoryDataset& dataset) {
    if (!document.contains("records") || !document["records"].is_array()) {
        setError("Dataset document requires a 'records' array");
        throw ValidationError(last_error_);
    }

    for (const auto& record : document["records"]) {
        if (!record.is_object()) {
            setError("Every record must be a JSON object");
            throw ValidationError(last_error_);
        }
        dataset.records.push_back(record);
    }

    if (document.contains("fields")) {
        for (const auto& field : document["fields"]) {
            dataset.fields.emplace_back(field.at("id").get<std::string>(),
                                        field.value("type", std::string("text")));
        }
        return;
    }

    // No field list: infer it from the records, in first-seen order
    std::vector<std::string> order;
    std::map<std::string, std::vector<Json>> values;
    for (const auto& record : dataset.records) {
        for (auto it = record.begin(); it != record.end(); ++it) {
            if (values.find(it.key()) == values.end()) {
                order.push_back(it.key());
                values[it.key()];
            }
            if (!it.value().is_null()) {
                values[it.key()].push_back(it.value());
            }
        }
    }
    for (const auto& id : order) {
        dataset.fields.emplace_back(id, id == GEOMETRY_FIELD ? "text" : inferFieldType(values[id]));
    }
}

void DatasetReader::parseFeatureCollection(const Json& geojson, MemoryDataset& dataset) {
    if (!geojson.contains("features") || !geojson["features"].is_array()) {
        setError("Invalid GeoJSON: FeatureCollection without a 'features' array");
        throw ValidationError(last_error_);
    }

    std::vector<std::string> order;
    std::map<std::string, std::vector<Json>> values;

    for (const auto& feature_json : geojson["features"]) {
        if (!feature_json.contains("type") || feature_json["type"] != "Feature") {
            setError("Invalid feature: Expected Feature type");
            throw ValidationError(last_error_);
        }

        Record record = Json::object();
        Json properties = feature_json.value("properties", Json::object());
        if (properties.is_object()) {
            for (auto it = properties.begin(); it != properties.end(); ++it) {
                if (it.key() == GEOMETRY_FIELD) {
                    continue;
                }
                if (values.find(it.key()) == values.end()) {
                    order.push_back(it.key());
                    values[it.key()];
                }
                if (!it.value().is_null()) {
                    values[it.key()].push_back(it.value());
                }
                record[it.key()] = it.value();
            }
        }
        record[GEOMETRY_FIELD] = feature_json.value(GEOMETRY_FIELD, Json());
        dataset.records.push_back(std::move(record));
    }

    for (const auto& id : order) {
        dataset.fields.emplace_back(id, inferFieldType(values[id]));
    }
    dataset.fields.emplace_back(GEOMETRY_FIELD, "text");

    // Records missing a property still carry every field, in field order
    for (auto& record : dataset.records) {
        Record ordered = Json::object();
        for (const auto& field : dataset.fields) {
            ordered[field.id] = record.contains(field.id) ? record[field.id] : Json();
        }
        record = std::move(ordered);
    }
}

std::string DatasetReader::inferFieldType(const std::vector<Json>& values) {
    if (values.empty()) {
        return "text";
    }

    bool all_integer = true;
    bool all_number = true;
    for (const auto& value : values) {
        if (!value.is_number_integer()) all_integer = false;
        if (!value.is_number()) all_number = false;
    }

    if (all_integer) return "int";
    if (all_number) return "float";
    return "text";
}

} // namespace io
} // namespace iotrans
