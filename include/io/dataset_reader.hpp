#ifndef IOTRANS_DATASET_READER_HPP
#define IOTRANS_DATASET_READER_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "io/record_source.hpp"

namespace iotrans {
namespace io {

/**
 * Reader for dataset documents on disk, used to feed a MemoryRecordSource.
 *
 * Two document shapes are accepted:
 *  - a table: {"name": ..., "fields": [{"id": ..., "type": ...}], "records": [{...}]}
 *  - a GeoJSON FeatureCollection; properties become fields and each feature's
 *    geometry lands in the "geometry" field
 */
class DatasetReader {
public:
    /**
     * Read a dataset document from a file
     * @param filepath Path to the JSON document
     * @return Dataset; its name defaults to the file stem
     * @throws ValidationError if the file cannot be read or parsed
     */
    static MemoryDataset readFromFile(const std::string& filepath);

    /**
     * Parse a dataset document from a string
     * @param json_string JSON document
     * @param default_name Name used when the document does not carry one
     * @return Dataset
     * @throws ValidationError if the string cannot be parsed
     */
    static MemoryDataset readFromString(const std::string& json_string, const std::string& default_name);

    /**
     * Get the last error message
     * @return Error message from the last operation
     */
    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    /**
     * Convert a FeatureCollection into a table dataset
     * @param geojson Parsed FeatureCollection
     * @param dataset Dataset to fill (name already set)
     */
    static void parseFeatureCollection(const Json& geojson, MemoryDataset& dataset);

    /**
     * Read fields and records of a table document
     * @param document Parsed table document
     * @param dataset Dataset to fill (name already set)
     */
    static void parseTable(const Json& document, MemoryDataset& dataset);

    /**
     * Infer a semantic type from the values seen for a field
     * @param values Non-null values of the field
     * @return "int", "float" or "text"
     */
    static std::string inferFieldType(const std::vector<Json>& values);

    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    DatasetReader() = delete;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_DATASET_READER_HPP
