#include "io/record_source.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <utility>

namespace iotrans {
namespace io {

PagedRecordStream::PagedRecordStream(RecordSource& source, std::string resource_id, size_t page_size)
    : source_(source), resource_id_(std::move(resource_id)), page_size_(page_size),
      offset_(0), page_count_(0), position_(0), exhausted_(false) {}

bool PagedRecordStream::next(Record& record) {
    while (!exhausted_) {
        if (position_ < page_.size()) {
            record = std::move(page_[position_++]);
            return true;
        }

        // Current page consumed, ask for the next one
        page_ = source_.fetchPage(resource_id_, page_size_, offset_);
        ++page_count_;
        position_ = 0;
        offset_ += page_.size();

        if (page_.empty()) {
            exhausted_ = true;
        }
    }
    return false;
}

void MemoryRecordSource::addDataset(const std::string& resource_id, MemoryDataset dataset) {
    datasets_[resource_id] = std::move(dataset);
}

const MemoryDataset& MemoryRecordSource::find(const std::string& resource_id) const {
    auto it = datasets_.find(resource_id);
    if (it == datasets_.end()) {
        throw ValidationError("Resource " + resource_id + " does not exist");
    }
    return it->second;
}

ResourceInfo MemoryRecordSource::getResource(const std::string& resource_id) {
    return find(resource_id).resource;
}

std::vector<FieldInfo> MemoryRecordSource::getFields(const std::string& resource_id) {
    return find(resource_id).fields;
}

std::vector<Record> MemoryRecordSource::fetchPage(const std::string& resource_id, size_t limit, size_t offset) {
    const MemoryDataset& dataset = find(resource_id);
    ++fetch_count_;

    std::vector<Record> page;
    if (offset >= dataset.records.size()) {
        return page;
    }

    size_t end = std::min(dataset.records.size(), offset + limit);
    page.assign(dataset.records.begin() + static_cast<long>(offset),
                dataset.records.begin() + static_cast<long>(end));
    return page;
}

} // namespace io
} // namespace iotrans
