#ifndef IOTRANS_JSON_ARRAY_WRITER_HPP
#define IOTRANS_JSON_ARRAY_WRITER_HPP

#include <cstddef>
#include <string>
#include "io/record_stream.hpp"

namespace iotrans {
namespace io {

/**
 * Streams records into a single JSON array without holding them in memory.
 * Output is always a valid array, including for zero records.
 */
class JsonArrayWriter {
public:
    JsonArrayWriter() : written_count_(0) {}
    ~JsonArrayWriter() = default;

    // Disable copy constructor and assignment
    JsonArrayWriter(const JsonArrayWriter&) = delete;
    JsonArrayWriter& operator=(const JsonArrayWriter&) = delete;

    /**
     * Write every record of a stream as one JSON array
     * @param output_file_path Output file path (.json)
     * @param records Record stream, consumed to exhaustion
     * @return true if successful, false otherwise
     */
    bool writeRecords(const std::string& output_file_path, RecordStream& records);

    size_t getWrittenCount() const { return written_count_; }

    std::string getLastError() const { return last_error_; }
    void clearError() { last_error_.clear(); }

private:
    std::string last_error_;
    size_t written_count_;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_JSON_ARRAY_WRITER_HPP
