#ifndef IOTRANS_JSONL_CACHE_HPP
#define IOTRANS_JSONL_CACHE_HPP

#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include "core/types.hpp"
#include "io/record_stream.hpp"

namespace iotrans {
namespace io {

/**
 * Local JSON-lines copy of a dataset: written once, then read any number of times.
 * Each physical line holds exactly one compact JSON record.
 */
class JsonLinesCache {
public:
    /**
     * @param file_path Cache file location (created by materialize)
     */
    explicit JsonLinesCache(std::string file_path);

    // Disable copy constructor and assignment
    JsonLinesCache(const JsonLinesCache&) = delete;
    JsonLinesCache& operator=(const JsonLinesCache&) = delete;

    /**
     * Drain a record stream into the cache file
     * @param records Source stream, consumed to exhaustion
     * @return Number of records written
     * @throws IoError if the cache is already materialized or the file cannot be written
     */
    size_t materialize(RecordStream& records);

    /**
     * Open a fresh stream over the cached records, starting at the first record
     * @return Record stream
     * @throws IoError if the cache has not been materialized
     */
    std::unique_ptr<RecordStream> open() const;

    /**
     * Delete the cache file
     * @return true if the file is gone afterwards
     */
    bool remove();

    bool isMaterialized() const { return materialized_; }
    size_t getRecordCount() const { return record_count_; }
    const std::string& getFilePath() const { return file_path_; }

private:
    std::string file_path_;
    size_t record_count_;
    bool materialized_;
};

/**
 * Record stream reading one JSON object per line
 */
class JsonLinesRecordStream : public RecordStream {
public:
    /**
     * @param file_path JSON-lines file
     * @throws IoError if the file cannot be opened
     */
    explicit JsonLinesRecordStream(const std::string& file_path);

    /**
     * @throws IoError if a line is not a JSON object
     */
    bool next(Record& record) override;

private:
    std::ifstream file_;
    std::string file_path_;
    size_t line_number_;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_JSONL_CACHE_HPP
