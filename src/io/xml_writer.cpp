#include "io/xml_writer.hpp"
#include "io/csv_writer.hpp"
#include <cctype>
#include <fstream>
#include <map>

namespace iotrans {
namespace io {

namespace {
const char* const XML_ENCODING = "utf-8";
const char* const ROOT_TAG = "DATA";
const char* const ROW_TAG = "ROW";
}

std::string XmlWriter::sanitizeTagName(const std::string& field_name) {
    std::string tag;
    tag.reserve(field_name.size() + 1);
    for (char c : field_name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_') {
            tag += c;
        }
    }

    if (tag.empty() || !(std::isalpha(static_cast<unsigned char>(tag[0])) || tag[0] == '_')) {
        tag.insert(tag.begin(), '_');
    }
    return tag;
}

std::string XmlWriter::escapeText(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

bool XmlWriter::writeRecords(const XmlWriterConfig& config, RecordStream& records) {
    clearError();
    written_count_ = 0;

    if (config.chunk_size == 0) {
        last_error_ = "XML chunk size must be positive";
        return false;
    }

    std::ofstream file(config.output_file_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        last_error_ = "Failed to create output file: " + config.output_file_path;
        return false;
    }

    file << "<?xml version=\"1.0\" encoding=\"" << XML_ENCODING << "\"?>\n";
    file << "<" << ROOT_TAG << ">";

    // Sanitized names are cached since every row repeats the same fields
    std::map<std::string, std::string> tag_names;
    std::string chunk;
    size_t chunk_rows = 0;

    Record record;
    while (records.next(record)) {
        chunk += "<";
        chunk += ROW_TAG;
        chunk += " count=\"" + std::to_string(written_count_) + "\">";

        for (auto it = record.begin(); it != record.end(); ++it) {
            auto tag_it = tag_names.find(it.key());
            if (tag_it == tag_names.end()) {
                tag_it = tag_names.emplace(it.key(), sanitizeTagName(it.key())).first;
            }
            const std::string& tag = tag_it->second;
            chunk += "<" + tag + ">" + escapeText(formatTextValue(it.value())) + "</" + tag + ">";
        }

        chunk += "</";
        chunk += ROW_TAG;
        chunk += ">";
        ++written_count_;

        if (++chunk_rows >= config.chunk_size) {
            file << chunk;
            chunk.clear();
            chunk_rows = 0;
            if (!file) {
                last_error_ = "Failed to write to file: " + config.output_file_path;
                return false;
            }
        }
    }

    // Flush any rows in the remaining chunk
    file << chunk;
    file << "</" << ROOT_TAG << ">";
    file.close();
    if (file.fail()) {
        last_error_ = "Failed to write to file: " + config.output_file_path;
        return false;
    }
    return true;
}

} // namespace io
} // namespace iotrans
