#ifndef IOTRANS_RECORD_SOURCE_HPP
#define IOTRANS_RECORD_SOURCE_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "io/record_stream.hpp"

namespace iotrans {
namespace io {

/**
 * Backing store the engine reads datasets from.
 * Pages must be stably ordered: the same offset always yields the same records.
 */
class RecordSource {
public:
    virtual ~RecordSource() = default;

    /**
     * Resource metadata
     * @param resource_id Resource identifier
     * @return Display name and whether the backing store is queryable
     * @throws ValidationError if the resource does not exist
     */
    virtual ResourceInfo getResource(const std::string& resource_id) = 0;

    /**
     * Ordered field list with semantic types
     * @param resource_id Resource identifier
     * @return Fields of the dataset
     */
    virtual std::vector<FieldInfo> getFields(const std::string& resource_id) = 0;

    /**
     * Read one page of records
     * @param resource_id Resource identifier
     * @param limit Maximum number of records
     * @param offset Index of the first record
     * @return Records; empty once past the end
     */
    virtual std::vector<Record> fetchPage(const std::string& resource_id, size_t limit, size_t offset) = 0;
};

/**
 * Concatenates fixed-size pages of a record source into one stream
 */
class PagedRecordStream : public RecordStream {
public:
    PagedRecordStream(RecordSource& source, std::string resource_id, size_t page_size);

    bool next(Record& record) override;

    /**
     * Number of pages requested so far (including the final empty one)
     */
    size_t getPageCount() const { return page_count_; }

private:
    RecordSource& source_;
    std::string resource_id_;
    size_t page_size_;
    size_t offset_;
    size_t page_count_;
    std::vector<Record> page_;
    size_t position_;
    bool exhausted_;
};

/**
 * Dataset held in memory by MemoryRecordSource
 */
struct MemoryDataset {
    ResourceInfo resource;
    std::vector<FieldInfo> fields;
    std::vector<Record> records;
};

/**
 * Record source backed by in-process datasets
 */
class MemoryRecordSource : public RecordSource {
public:
    MemoryRecordSource() = default;

    /**
     * Register (or replace) a dataset
     * @param resource_id Resource identifier
     * @param dataset Dataset contents
     */
    void addDataset(const std::string& resource_id, MemoryDataset dataset);

    ResourceInfo getResource(const std::string& resource_id) override;
    std::vector<FieldInfo> getFields(const std::string& resource_id) override;
    std::vector<Record> fetchPage(const std::string& resource_id, size_t limit, size_t offset) override;

    /**
     * Number of fetchPage calls served (lets callers verify the source is drained once)
     */
    size_t getFetchCount() const { return fetch_count_; }

private:
    std::map<std::string, MemoryDataset> datasets_;
    size_t fetch_count_ = 0;

    const MemoryDataset& find(const std::string& resource_id) const;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_RECORD_SOURCE_HPP
