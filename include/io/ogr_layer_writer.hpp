#ifndef IOTRANS_OGR_LAYER_WRITER_HPP
#define IOTRANS_OGR_LAYER_WRITER_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <gdal.h>
#include <ogr_api.h>
#include "core/config.hpp"
#include "core/types.hpp"
#include "io/record_stream.hpp"

namespace iotrans {
namespace io {

/**
 * One attribute column of an OGR layer
 */
struct OgrFieldSpec {
    std::string source_id;      // Field name in the record
    std::string output_name;    // Column name in the layer (differs for truncated shapefile names)
    SpatialFieldType type;      // Column type

    OgrFieldSpec() : type(SpatialFieldType::STRING) {}
    OgrFieldSpec(std::string source, std::string output, SpatialFieldType field_type)
        : source_id(std::move(source)), output_name(std::move(output)), type(field_type) {}
};

/**
 * Configuration for OGR layer writer
 */
struct OgrLayerWriterConfig {
    std::string output_file_path;             // Output file path
    std::string driver_name;                  // GDAL driver ("GeoJSON", "GPKG", "ESRI Shapefile")
    std::string layer_name;                   // Layer name
    int target_epsg;                          // Layer coordinate system
    std::string geometry_type;                // Layer geometry type name (e.g. "MultiPolygon")
    std::vector<OgrFieldSpec> fields;         // Attribute columns, in order
    std::vector<std::string> layer_options;   // Driver layer creation options ("KEY=VALUE")

    OgrLayerWriterConfig() : target_epsg(0) {}
};

/**
 * Writes records with a structured GeoJSON "geometry" field into a single-layer
 * vector dataset through GDAL/OGR.
 */
class OgrLayerWriter {
public:
    OgrLayerWriter();
    ~OgrLayerWriter() = default;

    // Disable copy constructor and assignment
    OgrLayerWriter(const OgrLayerWriter&) = delete;
    OgrLayerWriter& operator=(const OgrLayerWriter&) = delete;

    /**
     * Create the dataset and write every record of a stream as one feature
     * @param config Writer configuration
     * @param records Record stream, consumed to exhaustion
     * @return true if successful, false otherwise
     */
    bool writeRecords(const OgrLayerWriterConfig& config, RecordStream& records);

    /**
     * Number of features written by the last call
     */
    size_t getWrittenCount() const { return written_count_; }

    /**
     * Get the last error message
     * @return Error message string
     */
    std::string getLastError() const { return last_error_; }

    /**
     * Clear the last error message
     */
    void clearError() { last_error_.clear(); }

private:
    std::string last_error_;  // Last error message
    size_t written_count_;

    /**
     * Create the dataset and its layer with the configured schema
     * @param config Writer configuration
     * @param layer Receives the created layer
     * @return Dataset handle, or nullptr on failure
     */
    GDALDatasetH createGDALDataset(const OgrLayerWriterConfig& config, OGRLayerH& layer);

    /**
     * Write one record as a feature
     * @param layer Target layer
     * @param config Writer configuration
     * @param record Record with normalized geometry
     * @return true if successful, false otherwise
     */
    bool writeFeature(OGRLayerH layer, const OgrLayerWriterConfig& config, const Record& record);

    /**
     * Set one attribute of a feature from a record value
     */
    void setFieldValue(OGRFeatureH feature, int field_index, const OgrFieldSpec& spec, const Json& value);
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_OGR_LAYER_WRITER_HPP
