#pragma once

/**
 * Core data model: source provenance and persisted question records.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace quarry {

/**
 * Kind of media a question was mined from.
 */
enum class SourceType {
    Video,
    Audio,
    Article
};

// Returns "video", "audio" or "article".
std::string to_string(SourceType type);

// Parses a source type name (case-insensitive). Returns nullopt if unknown.
std::optional<SourceType> parse_source_type(const std::string& name);

/**
 * Where a question was asked.
 */
struct SourceRef {
    SourceType type = SourceType::Article;
    std::string url;                        // Link to the interview.
    std::string title;                      // Human-readable source title.
    std::optional<double> media_timestamp;  // Seconds into the media, if known.
    std::string published;                  // Publication date, free-form, may be empty.
};

/**
 * A question as persisted in the metadata store.
 *
 * Immutable once committed. sources holds one entry unless deduplication
 * merged several phrasings; the first entry is the primary provenance.
 */
struct QuestionRecord {
    uint64_t id = 0;                 // Per-subject id shared with the vector store.
    std::string subject_id;          // Subject key owning this record.
    std::string text;                // Never empty.
    std::vector<SourceRef> sources;  // At least one entry.
    int64_t captured_at = 0;         // Unix time the record was indexed.

    const SourceRef& primary_source() const { return sources.front(); }
};

// Normalizes a subject name into its storage key: lower case, spaces and
// path separators replaced by underscores, surrounding whitespace trimmed.
std::string subject_key(const std::string& name);

nlohmann::json source_to_json(const SourceRef& source);
SourceRef source_from_json(const nlohmann::json& j);

nlohmann::json record_to_json(const QuestionRecord& record);

// Parses a record. Throws std::invalid_argument if required fields are missing.
QuestionRecord record_from_json(const nlohmann::json& j);

} // namespace quarry
