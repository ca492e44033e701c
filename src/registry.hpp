#pragma once

/**
 * Per-subject bookkeeping for the quarry index.
 *
 * The registry records when each subject was last indexed, how many
 * sources of each kind fed it and how many questions it holds. It lives in
 * its own JSON file and loads without the vector or metadata stores.
 */

#include "question_record.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace quarry {

/**
 * Number of sources ingested per media type.
 */
struct SourceCounts {
    int64_t video = 0;
    int64_t audio = 0;
    int64_t article = 0;

    void add(SourceType type, int64_t n = 1);
    int64_t get(SourceType type) const;
    int64_t total() const { return video + audio + article; }
};

enum class SubjectStatus {
    Indexed,   // Last run produced questions with full refinement.
    Empty,     // Nothing indexed yet; the next request re-ingests.
    Degraded   // Last run fell back to heuristics-only extraction.
};

std::string to_string(SubjectStatus status);

/**
 * Registry state for a single subject.
 */
struct RegistryEntry {
    std::string subject_id;             // Storage key (see subject_key()).
    std::string display_name;           // Name as first given by a caller.
    int64_t last_indexed_at = 0;        // Unix time of the last ingestion.
    SourceCounts source_counts;
    int64_t question_count = 0;
    SubjectStatus status = SubjectStatus::Empty;
    std::vector<std::string> sources;   // URLs already ingested, in order.
};

/**
 * Additive change applied by one ingestion run.
 */
struct RegistryDelta {
    std::string display_name;
    SourceCounts source_counts;
    int64_t question_count = 0;
    std::vector<std::string> sources;
    bool degraded = false;
};

/**
 * Thread-safe registry backed by a JSON file.
 */
class EntityRegistry {
public:
    explicit EntityRegistry(std::string path);

    /**
     * Loads the registry file. A missing file yields an empty registry.
     * Entries that fail to parse are kept aside and reported as
     * RegistryCorruptError when their subject is requested; a file that is
     * not JSON at all throws RegistryCorruptError immediately.
     */
    void load();

    /**
     * Returns the entry for a subject, or nullopt if it was never indexed.
     * Throws RegistryCorruptError if the stored entry is unreadable.
     */
    std::optional<RegistryEntry> get(const std::string& subject) const;

    /**
     * Adds delta to the subject's entry, creating it if absent, and sets
     * last_indexed_at to now. Counts never decrease.
     */
    RegistryEntry upsert(const std::string& subject, const RegistryDelta& delta, int64_t now);

    // Removes a subject's entry, including a corrupt one. Returns true if removed.
    bool reset(const std::string& subject);

    // All readable entries, ordered by subject key.
    std::vector<RegistryEntry> list() const;

    // Subject keys whose entries could not be parsed.
    std::vector<std::string> corrupt_subjects() const;

    /**
     * Writes the registry to disk via a temporary file and rename.
     * Corrupt entries are written back unchanged until reset.
     */
    void flush() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, RegistryEntry> entries_;
    std::map<std::string, nlohmann::json> corrupt_;  // Raw JSON of unreadable entries.
};

nlohmann::json entry_to_json(const RegistryEntry& entry);

// Parses an entry. Throws std::invalid_argument on malformed input.
RegistryEntry entry_from_json(const std::string& key, const nlohmann::json& j);

} // namespace quarry
