#pragma once

/**
 * Id-keyed question metadata for one subject, persisted as JSON.
 */

#include "question_record.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace quarry {

class MetadataStore {
public:
    /**
     * Stores a record under its id. Throws IndexWriteError if the id is
     * taken or the record has no text or no source.
     */
    void put(const QuestionRecord& record);

    bool erase(uint64_t id) { return records_.erase(id) > 0; }

    // Returns nullptr if no record has this id.
    const QuestionRecord* find(uint64_t id) const;

    bool contains(uint64_t id) const { return records_.count(id) > 0; }
    size_t count() const { return records_.size(); }
    std::vector<uint64_t> ids() const;

    // Records in ascending id order (insertion order, since ids are monotonic).
    std::vector<QuestionRecord> records() const;

    // Writes {"next_id": ..., "records": {id: record}} atomically.
    void save(const std::string& path, uint64_t next_id) const;

    // Reads a file written by save(). Throws std::runtime_error if malformed.
    static MetadataStore load(const std::string& path, uint64_t& next_id);

private:
    std::map<uint64_t, QuestionRecord> records_;
};

} // namespace quarry
