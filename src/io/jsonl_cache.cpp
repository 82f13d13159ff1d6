#include "io/jsonl_cache.hpp"
#include "core/errors.hpp"
#include <boost/filesystem.hpp>
#include <utility>

namespace iotrans {
namespace io {

JsonLinesCache::JsonLinesCache(std::string file_path)
    : file_path_(std::move(file_path)), record_count_(0), materialized_(false) {}

size_t JsonLinesCache::materialize(RecordStream& records) {
    if (materialized_) {
        throw IoError("Cache already materialized: " + file_path_);
    }

    std::ofstream file(file_path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Failed to open cache file for writing: " + file_path_);
    }

    size_t count = 0;
    Record record;
    while (records.next(record)) {
        // Invalid UTF-8 in source text is replaced rather than failing the whole dump
        file << record.dump(-1, ' ', false, Json::error_handler_t::replace) << '\n';
        if (!file) {
            throw IoError("Failed to write cache file: " + file_path_);
        }
        ++count;
    }

    file.close();
    if (file.fail()) {
        throw IoError("Failed to close cache file: " + file_path_);
    }

    record_count_ = count;
    materialized_ = true;
    return count;
}

std::unique_ptr<RecordStream> JsonLinesCache::open() const {
    if (!materialized_) {
        throw IoError("Cache has not been materialized: " + file_path_);
    }
    return std::make_unique<JsonLinesRecordStream>(file_path_);
}

bool JsonLinesCache::remove() {
    boost::system::error_code ec;
    boost::filesystem::remove(file_path_, ec);
    if (ec) {
        return false;
    }
    materialized_ = false;
    return true;
}

JsonLinesRecordStream::JsonLinesRecordStream(const std::string& file_path)
    : file_(file_path, std::ios::in | std::ios::binary), file_path_(file_path), line_number_(0) {
    if (!file_.is_open()) {
        throw IoError("Failed to open cache file: " + file_path);
    }
}

bool JsonLinesRecordStream::next(Record& record) {
    std::string line;
    while (std::getline(file_, line)) {
        ++line_number_;
        if (line.empty()) {
            continue;
        }

        try {
            record = Json::parse(line);
        } catch (const Json::parse_error& e) {
            throw IoError("Corrupt cache line " + std::to_string(line_number_) + " in " +
                          file_path_ + ": " + e.what());
        }
        if (!record.is_object()) {
            throw IoError("Cache line " + std::to_string(line_number_) + " is not a record: " + file_path_);
        }
        return true;
    }
    return false;
}

} // namespace io
} // namespace iotrans
