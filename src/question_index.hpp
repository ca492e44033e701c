#pragma once

/**
 * Dual-store question index.
 *
 * Each subject owns a partition made of a FlatVectorStore and a
 * MetadataStore that share ids. A record is committed to both stores or to
 * neither: the vector is written first, and removed again if the metadata
 * write fails. Ids are allocated from a per-subject counter that only moves
 * forward, including across reset().
 *
 * Partitions are loaded lazily from <data_dir>/vectors and
 * <data_dir>/metadata on first use. Vectors left behind by an interrupted
 * flush (ids the metadata counter never reached) are dropped on load; any
 * other disagreement marks the subject corrupt until reset(). Readers take a shared lock on the
 * partition and writers an exclusive one, so a search never observes a
 * vector without its metadata.
 */

#include "metadata_store.hpp"
#include "question_record.hpp"
#include "vector_store.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace quarry {

/**
 * A stored question and its similarity to a query.
 */
struct Match {
    QuestionRecord record;
    float score = 0.0f;
};

/**
 * Counters for one subject partition.
 */
struct IndexStats {
    std::string subject_id;
    size_t vector_count = 0;
    size_t record_count = 0;
    uint64_t next_id = 0;
    bool corrupt = false;
    std::string corrupt_reason;
};

class QuestionIndex {
public:
    QuestionIndex(std::string data_dir, size_t dimension);

    /**
     * Assigns the next id to record and writes it to both stores. Throws
     * IndexWriteError if either write fails; nothing is left behind and the
     * id stays consumed. Throws IndexCorruptError for a corrupt subject.
     */
    uint64_t commit(const std::string& subject, QuestionRecord record,
                    const std::vector<float>& vector);

    /**
     * Exact search joined with metadata, best first. Returns at most over_k
     * matches; an unknown subject yields an empty list.
     */
    std::vector<Match> search(const std::string& subject, const std::vector<float>& query,
                              size_t over_k) const;

    // All records of a subject in id order.
    std::vector<QuestionRecord> records(const std::string& subject) const;

    // Number of committed records (equal in both stores).
    size_t count(const std::string& subject) const;

    // Partition counters; never throws for a corrupt subject.
    IndexStats stats(const std::string& subject) const;

    /**
     * Persists a subject's stores (vectors first, then metadata), each via
     * a temporary file and rename. Throws IndexWriteError on I/O failure.
     */
    void flush(const std::string& subject);

    // Flushes every partition with unsaved changes.
    void flush_all();

    /**
     * Drops every record of a subject and clears a corrupt flag. The id
     * counter is kept so ids are never reused. Returns the records removed.
     */
    size_t reset(const std::string& subject);

    size_t dimension() const { return dimension_; }
    std::string vector_path(const std::string& subject_id) const;
    std::string metadata_path(const std::string& subject_id) const;

private:
    struct Partition {
        explicit Partition(size_t dimension) : vectors(dimension) {}

        mutable std::shared_mutex mutex;
        FlatVectorStore vectors;
        MetadataStore metadata;
        uint64_t next_id = 0;
        bool dirty = false;
        std::string corrupt_reason;  // Non-empty when the persisted stores disagree.
    };

    // Returns the partition for a subject key, loading it on first use.
    Partition& partition(const std::string& key) const;

    std::unique_ptr<Partition> load_partition(const std::string& key) const;

    // Throws IndexCorruptError if the partition is marked corrupt.
    static void ensure_usable(const Partition& partition, const std::string& key);

    void save_partition(const Partition& partition, const std::string& key) const;

    std::string data_dir_;
    size_t dimension_;
    mutable std::mutex partitions_mutex_;
    mutable std::map<std::string, std::unique_ptr<Partition>> partitions_;
};

} // namespace quarry
