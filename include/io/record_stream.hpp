#ifndef IOTRANS_RECORD_STREAM_HPP
#define IOTRANS_RECORD_STREAM_HPP

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>
#include "core/types.hpp"

namespace iotrans {
namespace io {

/**
 * Finite, single-pass sequence of records pulled one at a time
 */
class RecordStream {
public:
    virtual ~RecordStream() = default;

    /**
     * Pull the next record
     * @param record Receives the record
     * @return false once the stream is exhausted
     */
    virtual bool next(Record& record) = 0;
};

/**
 * Stream over an in-memory vector (used for pages and tests)
 */
class VectorRecordStream : public RecordStream {
public:
    explicit VectorRecordStream(std::vector<Record> records)
        : records_(std::move(records)), position_(0) {}

    bool next(Record& record) override {
        if (position_ >= records_.size()) {
            return false;
        }
        record = records_[position_++];
        return true;
    }

private:
    std::vector<Record> records_;
    size_t position_;
};

/**
 * Applies a per-record transformation to another stream
 */
class MappedRecordStream : public RecordStream {
public:
    using Mapper = std::function<void(Record&)>;

    MappedRecordStream(RecordStream& inner, Mapper mapper)
        : inner_(inner), mapper_(std::move(mapper)) {}

    bool next(Record& record) override {
        if (!inner_.next(record)) {
            return false;
        }
        mapper_(record);
        return true;
    }

private:
    RecordStream& inner_;
    Mapper mapper_;
};

} // namespace io
} // namespace iotrans

#endif // IOTRANS_RECORD_STREAM_HPP
