#include "io/json_array_writer.hpp"
#include <fstream>
#include <optional>

namespace iotrans {
namespace io {

bool JsonArrayWriter::writeRecords(const std::string& output_file_path, RecordStream& records) {
    clearError();
    written_count_ = 0;

    std::ofstream file(output_file_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        last_error_ = "Failed to create output file: " + output_file_path;
        return false;
    }

    file << "[";

    // Hold one serialized record back so the separator is only written between records
    std::optional<std::string> pending;
    Record record;
    while (records.next(record)) {
        if (pending) {
            file << *pending << ",";
        }
        pending = record.dump(-1, ' ', false, Json::error_handler_t::replace);
        ++written_count_;
        if (!file) {
            last_error_ = "Failed to write to file: " + output_file_path;
            return false;
        }
    }
    if (pending) {
        file << *pending;
    }

    file << "]\n";
    file.close();
    if (file.fail()) {
        last_error_ = "Failed to write to file: " + output_file_path;
        return false;
    }
    return true;
}

} // namespace io
} // namespace iotrans
