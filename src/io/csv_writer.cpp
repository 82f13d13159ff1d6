#include "io/csv_writer.hpp"
#include <fstream>

namespace iotrans {
namespace io {

namespace {
const char* const CSV_LINE_TERMINATOR = "\r\n";
}

std::string formatTextValue(const Json& value) {
    if (value.is_null()) {
        return "";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string CsvWriter::escapeField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }

    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped += '"';
    for (char c : value) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::string CsvWriter::formatRow(const std::vector<std::string>& fields) {
    std::string row;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            row += ',';
        }
        row += escapeField(fields[i]);
    }
    return row;
}

bool CsvWriter::writeRecords(const CsvWriterConfig& config, RecordStream& records) {
    clearError();
    written_count_ = 0;

    if (config.columns.empty()) {
        last_error_ = "No columns to write";
        return false;
    }

    std::ofstream file(config.output_file_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        last_error_ = "Failed to create output file: " + config.output_file_path;
        return false;
    }

    file << formatRow(config.columns) << CSV_LINE_TERMINATOR;

    std::vector<std::string> fields(config.columns.size());
    Record record;
    while (records.next(record)) {
        for (size_t i = 0; i < config.columns.size(); ++i) {
            auto it = record.find(config.columns[i]);
            fields[i] = it == record.end() ? std::string() : formatTextValue(*it);
        }
        file << formatRow(fields) << CSV_LINE_TERMINATOR;
        if (!file) {
            last_error_ = "Failed to write to file: " + config.output_file_path;
            return false;
        }
        ++written_count_;
    }

    file.close();
    if (file.fail()) {
        last_error_ = "Failed to close file: " + config.output_file_path;
        return false;
    }
    return true;
}

} // namespace io
} // namespace iotrans
