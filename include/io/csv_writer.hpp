#ifndef IOTRANS_CSV_WRITER_HPP
#define IOTRANS_CSV_WRITER_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "io/record_stream.hpp"

namespace iotrans {
namespace io {

/**
 * Configuration for CSV output writer
 */
struct CsvWriterConfig {
    std::string output_file_path;       // Output file path (.csv)
    std::vector<std::string> columns;   // Header and column order

    CsvWriterConfig() = default;
};

/**
 * RFC 4180 CSV writer: header row, one row per record, CRLF line endings.
 * Fields have no size limit.
 */
class CsvWriter {
public:
    CsvWriter() : written_count_(0) {}
    ~CsvWriter() = default;

    // Disable copy constructor and assignment
    CsvWriter(const CsvWriter&) = delete;
    CsvWriter& operator=(const CsvWriter&) = delete;

    /**
     * Write every record of a stream; absent fields are written empty
     * @param config Writer configuration
     * @param records Record stream, consumed to exhaustion
     * @return true if successful, false otherwise
     */
    bool writeRecords(const CsvWriterConfig& config, RecordStream& records);

    /**
     * Quote a field when it contains a comma, quote, CR or LF; quotes are doubled
     * @param value Raw field text
     * @return CSV field
     */
    static std::string escapeField(const std::string& value);

    /**
     * Join fields into one CSV row (without the line terminator)
     * @param fields Raw field texts
     * @return CSV row
     */
    static std::string formatRow(const std::vector<std::string>& fields);

    /**
     * Number of data rows written by the last call
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
};

/**
 * Text form of a scalar record value shared by the text writers:
 * null is empty, booleans are lowercase, numbers use JSON notation, strings are raw
 * and nested values are compact JSON.
 * @param value Record value
 * @return Text
 */
std::string formatTextValue(const Json& value);

} // namespace io
} // namespace iotrans

#endif // IOTRANS_CSV_WRITER_HPP
