#ifndef IOTRANS_SHAPEFILE_WRITER_HPP
#define IOTRANS_SHAPEFILE_WRITER_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "io/ogr_layer_writer.hpp"
#include "io/record_stream.hpp"

namespace iotrans {
namespace io {

/**
 * Configuration for zipped shapefile writer
 */
struct ShapefileWriterConfig {
    std::string output_file_path;       // Nominal .shp path; the bundle is written beside it as .zip
    std::string dataset_name;           // Names the "{dataset_name} fields.csv" mapping file
    int target_epsg;                    // Layer coordinate system
    std::string geometry_type;          // Layer geometry type name
    std::vector<OgrFieldSpec> fields;   // Attribute columns; output names are assigned from the column map

    ShapefileWriterConfig() : target_epsg(0) {}
};

/**
 * Shapefile output packaged as a zip bundle.
 *
 * The shapefile set (.shp .shx .dbf .prj .cpg) is written into a scratch
 * directory next to the output, together with a field mapping CSV, zipped
 * into "{output stem}.zip", and the scratch directory is removed again.
 * Field names longer than the 10-character dBASE limit trigger renaming of
 * every attribute column.
 */
class ShapefileWriter {
public:
    ShapefileWriter() : written_count_(0) {}
    ~ShapefileWriter() = default;

    // Disable copy constructor and assignment
    ShapefileWriter(const ShapefileWriter&) = delete;
    ShapefileWriter& operator=(const ShapefileWriter&) = delete;

    /**
     * Write every record of a stream into the zip bundle
     * @param config Writer configuration
     * @param records Record stream with normalized geometries, consumed to exhaustion
     * @return true if successful, false otherwise
     */
    bool writeRecords(const ShapefileWriterConfig& config, RecordStream& records);

    /**
     * Column map for shapefile attribute names. Empty when every name fits;
     * otherwise every field becomes its first 7 characters plus its 1-based
     * position (the prefix shrinks when the position needs more digits).
     * Names are unique ignoring case: a clashing name gets a shorter prefix,
     * then an "_" before the position. Prefixes end on a UTF-8 character boundary.
     * @param field_ids Non-geometry field ids, in order
     * @return Original id -> shapefile column name
     * @throws SchemaError if no unique name fits in 10 bytes
     */
    static std::map<std::string, std::string> buildColumnMap(const std::vector<std::string>& field_ids);

    /**
     * Leading bytes of a UTF-8 string, cut back to a character boundary
     * @param text UTF-8 text
     * @param max_bytes Maximum prefix size in bytes
     * @return Prefix of at most max_bytes bytes
     */
    static std::string utf8Prefix(const std::string& text, size_t max_bytes);

    /**
     * Write the field mapping CSV (columns "field,name": shapefile name, original name)
     * @param file_path Output CSV path
     * @param field_ids Non-geometry field ids, in order
     * @param column_map Column map from buildColumnMap
     * @return true if successful, false otherwise
     */
    bool writeFieldsFile(const std::string& file_path,
                         const std::vector<std::string>& field_ids,
                         const std::map<std::string, std::string>& column_map);

    /**
     * Path of the zip bundle produced by the last successful call
     */
    const std::string& getOutputPath() const { return output_path_; }

    size_t getWrittenCount() const { return written_count_; }

    std::string getLastError() const { return last_error_; }
    void clearError() { last_error_.clear(); }

private:
    std::string last_error_;
    std::string output_path_;
    size_t written_count_;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_SHAPEFILE_WRITER_HPP
