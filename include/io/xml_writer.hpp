#ifndef IOTRANS_XML_WRITER_HPP
#define IOTRANS_XML_WRITER_HPP

#include <cstddef>
#include <string>
#include "io/record_stream.hpp"

namespace iotrans {
namespace io {

/**
 * Configuration for XML output writer
 */
struct XmlWriterConfig {
    std::string output_file_path;   // Output file path (.xml)
    size_t chunk_size;              // Rows buffered before each disk write

    XmlWriterConfig() : chunk_size(5000) {}
};

/**
 * Writes records as <DATA><ROW count="N"><field>value</field>...</ROW></DATA>,
 * one child element per record field in record order.
 */
class XmlWriter {
public:
    XmlWriter() : written_count_(0) {}
    ~XmlWriter() = default;

    // Disable copy constructor and assignment
    XmlWriter(const XmlWriter&) = delete;
    XmlWriter& operator=(const XmlWriter&) = delete;

    /**
     * Write every record of a stream
     * @param config Writer configuration
     * @param records Record stream, consumed to exhaustion
     * @return true if successful, false otherwise
     */
    bool writeRecords(const XmlWriterConfig& config, RecordStream& records);

    /**
     * Turn a field name into a valid element name: characters outside
     * [A-Za-z0-9_-] are dropped and "_" is prepended unless the result
     * starts with a letter or underscore
     * @param field_name Field name
     * @return Element name
     */
    static std::string sanitizeTagName(const std::string& field_name);

    /**
     * Escape text content (&, <, >)
     * @param text Raw text
     * @return Escaped text
     */
    static std::string escapeText(const std::string& text);

    size_t getWrittenCount() const { return written_count_; }

    std::string getLastError() const { return last_error_; }
    void clearError() { last_error_.clear(); }

private:
    std::string last_error_;
    size_t written_count_;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_XML_WRITER_HPP
