#include "question_index.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace quarry {

QuestionIndex::QuestionIndex(std::string data_dir, size_t dimension)
    : data_dir_(std::move(data_dir)),
      dimension_(dimension) {}

std::string QuestionIndex::vector_path(const std::string& subject_id) const {
    return (fs::path(data_dir_) / VECTOR_DIR / (subject_id + VECTOR_FILE_EXTENSION)).string();
}

std::string QuestionIndex::metadata_path(const std::string& subject_id) const {
    return (fs::path(data_dir_) / METADATA_DIR / (subject_id + METADATA_FILE_EXTENSION)).string();
}

// ========== Loading ==========

std::unique_ptr<QuestionIndex::Partition> QuestionIndex::load_partition(const std::string& key) const {
    auto p = std::make_unique<Partition>(dimension_);
    std::string vpath = vector_path(key);
    std::string mpath = metadata_path(key);
    bool has_vectors = fs::exists(vpath);
    bool has_metadata = fs::exists(mpath);

    if (!has_vectors && !has_metadata) {
        return p;
    }

    auto mark_corrupt = [&](const std::string& reason) {
        if (p->corrupt_reason.empty()) {
            p->corrupt_reason = reason;
        }
    };

    // Each store is read on its own so the id counter survives as long as
    // either file is readable.
    bool vectors_ok = false;
    bool metadata_ok = false;
    uint64_t metadata_next_id = 0;

    if (has_vectors) {
        try {
            uint64_t next_id = 0;
            FlatVectorStore vectors = FlatVectorStore::load(vpath, next_id);
            p->next_id = std::max(p->next_id, next_id);
            if (vectors.dimension() != dimension_) {
                mark_corrupt("vector dimension " + std::to_string(vectors.dimension()) +
                             " does not match embedder dimension " + std::to_string(dimension_));
            } else {
                p->vectors = std::move(vectors);
                vectors_ok = true;
            }
        } catch (const std::exception& e) {
            mark_corrupt(e.what());
        }
    } else {
        mark_corrupt("vector file is missing");
    }

    if (has_metadata) {
        try {
            p->metadata = MetadataStore::load(mpath, metadata_next_id);
            p->next_id = std::max(p->next_id, metadata_next_id);
            metadata_ok = true;
        } catch (const std::exception& e) {
            mark_corrupt(e.what());
        }
    } else {
        mark_corrupt("metadata file is missing");
    }

    if (vectors_ok && metadata_ok) {
        // The vector file is always replaced first, so vectors at or above
        // the metadata counter belong to a flush that never completed.
        std::vector<uint64_t> uncommitted;
        for (uint64_t id : p->vectors.ids()) {
            if (id >= metadata_next_id && !p->metadata.contains(id)) {
                uncommitted.push_back(id);
            }
        }
        for (uint64_t id : uncommitted) {
            p->vectors.remove(id);
        }
        if (!uncommitted.empty()) {
            warn_log("INDEX", "Subject '" + key + "': dropped " + std::to_string(uncommitted.size()) +
                     " vectors from an interrupted flush");
            p->dirty = true;
        }

        std::vector<uint64_t> vector_ids = p->vectors.ids();
        std::sort(vector_ids.begin(), vector_ids.end());
        std::vector<uint64_t> metadata_ids = p->metadata.ids();
        if (vector_ids != metadata_ids) {
            mark_corrupt("vector store holds " + std::to_string(vector_ids.size()) +
                         " ids, metadata store " + std::to_string(metadata_ids.size()) +
                         ", and the id sets differ");
        }
        if (!vector_ids.empty()) {
            p->next_id = std::max(p->next_id, vector_ids.back() + 1);
        }
    }

    if (!p->corrupt_reason.empty()) {
        warn_log("INDEX", "Subject '" + key + "' is corrupt: " + p->corrupt_reason);
        p->vectors = FlatVectorStore(dimension_);
        p->metadata = MetadataStore();
    } else {
        verbose_log("INDEX", "Loaded '" + key + "': " + std::to_string(p->metadata.count()) +
                    " records, next id " + std::to_string(p->next_id));
    }
    return p;
}

QuestionIndex::Partition& QuestionIndex::partition(const std::string& key) const {
    std::lock_guard<std::mutex> lock(partitions_mutex_);
    auto it = partitions_.find(key);
    if (it == partitions_.end()) {
        it = partitions_.emplace(key, load_partition(key)).first;
    }
    return *it->second;
}

void QuestionIndex::ensure_usable(const Partition& partition, const std::string& key) {
    if (!partition.corrupt_reason.empty()) {
        throw IndexCorruptError(key, partition.corrupt_reason);
    }
}

// ========== Writes ==========

uint64_t QuestionIndex::commit(const std::string& subject, QuestionRecord record,
                               const std::vector<float>& vector) {
    std::string key = subject_key(subject);
    Partition& p = partition(key);
    std::unique_lock<std::shared_mutex> lock(p.mutex);
    ensure_usable(p, key);

    uint64_t id = p.next_id++;
    record.id = id;
    record.subject_id = key;

    p.vectors.insert(id, vector);
    try {
        p.metadata.put(record);
    } catch (const std::exception& e) {
        p.vectors.remove(id);
        throw IndexWriteError("Record " + std::to_string(id) + " for '" + key +
                              "' rolled back: " + e.what());
    }

    p.dirty = true;
    return id;
}

void QuestionIndex::save_partition(const Partition& partition, const std::string& key) const {
    try {
        partition.vectors.save(vector_path(key), partition.next_id);
        partition.metadata.save(metadata_path(key), partition.next_id);
    } catch (const std::exception& e) {
        throw IndexWriteError("Cannot persist index for '" + key + "': " + e.what());
    }
}

void QuestionIndex::flush(const std::string& subject) {
    std::string key = subject_key(subject);
    Partition& p = partition(key);
    std::unique_lock<std::shared_mutex> lock(p.mutex);
    if (!p.dirty || !p.corrupt_reason.empty()) {
        return;
    }

    save_partition(p, key);
    p.dirty = false;
    verbose_log("INDEX", "Flushed '" + key + "': " + std::to_string(p.metadata.count()) + " records");
}

void QuestionIndex::flush_all() {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(partitions_mutex_);
        for (const auto& [key, p] : partitions_) {
            keys.push_back(key);
        }
    }
    for (const auto& key : keys) {
        flush(key);
    }
}

size_t QuestionIndex::reset(const std::string& subject) {
    std::string key = subject_key(subject);
    Partition& p = partition(key);
    std::unique_lock<std::shared_mutex> lock(p.mutex);

    size_t removed = p.metadata.count();
    p.vectors = FlatVectorStore(dimension_);
    p.metadata = MetadataStore();
    p.corrupt_reason.clear();

    save_partition(p, key);
    p.dirty = false;
    verbose_log("INDEX", "Reset '" + key + "': removed " + std::to_string(removed) +
                " records, next id stays " + std::to_string(p.next_id));
    return removed;
}

// ========== Reads ==========

std::vector<Match> QuestionIndex::search(const std::string& subject, const std::vector<float>& query,
                                         size_t over_k) const {
    std::string key = subject_key(subject);
    const Partition& p = partition(key);
    std::shared_lock<std::shared_mutex> lock(p.mutex);
    ensure_usable(p, key);

    std::vector<Match> matches;
    if (p.vectors.count() == 0 || over_k == 0) {
        return matches;
    }

    for (const auto& hit : p.vectors.search(query, over_k)) {
        const QuestionRecord* record = p.metadata.find(hit.id);
        if (!record) {
            // Unreachable while commits hold the exclusive lock
            warn_log("INDEX", "Vector " + std::to_string(hit.id) + " of '" + key + "' has no metadata");
            continue;
        }
        matches.push_back({*record, hit.score});
    }
    return matches;
}

std::vector<QuestionRecord> QuestionIndex::records(const std::string& subject) const {
    std::string key = subject_key(subject);
    const Partition& p = partition(key);
    std::shared_lock<std::shared_mutex> lock(p.mutex);
    ensure_usable(p, key);
    return p.metadata.records();
}

size_t QuestionIndex::count(const std::string& subject) const {
    std::string key = subject_key(subject);
    const Partition& p = partition(key);
    std::shared_lock<std::shared_mutex> lock(p.mutex);
    ensure_usable(p, key);
    return p.metadata.count();
}

IndexStats QuestionIndex::stats(const std::string& subject) const {
    std::string key = subject_key(subject);
    const Partition& p = partition(key);
    std::shared_lock<std::shared_mutex> lock(p.mutex);

    IndexStats stats;
    stats.subject_id = key;
    stats.vector_count = p.vectors.count();
    stats.record_count = p.metadata.count();
    stats.next_id = p.next_id;
    stats.corrupt = !p.corrupt_reason.empty();
    stats.corrupt_reason = p.corrupt_reason;
    return stats;
}

} // namespace quarry
