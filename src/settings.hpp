#pragma once

/**
 * Settings persistence for the quarry CLI.
 *
 * Handles loading and saving of application settings to a local JSON file:
 * storage location, retrieval and extraction tuning, collaborator models,
 * and the interview sources configured for each subject.
 */

#include "config.hpp"
#include "sources.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quarry {

/**
 * Embedding collaborator selection.
 */
struct EmbeddingSettings {
    std::string provider = DEFAULT_EMBEDDING_PROVIDER;  // "hashing" or "openai".
    std::string model = DEFAULT_EMBEDDING_MODEL;        // Ignored by the hashing provider.
    std::string base_url = OPENAI_API_BASE;
    size_t dimension = DEFAULT_EMBEDDING_DIMENSION;
};

/**
 * Refinement collaborator selection.
 */
struct RefinerSettings {
    std::string model = DEFAULT_REFINER_MODEL;
    std::string base_url = OPENAI_API_BASE;
};

/**
 * Application settings stored in .quarry.json.
 *
 * Every field has a compiled-in default, so a file holding only the keys a
 * user wants to change is valid.
 */
struct Settings {
    std::string data_dir = DEFAULT_DATA_DIR;             // Registry and index location.
    float similarity_threshold = DEFAULT_SIMILARITY_THRESHOLD;
    size_t over_fetch_factor = DEFAULT_OVER_FETCH_FACTOR;
    size_t top_k = DEFAULT_TOP_K;
    int64_t freshness_days = DEFAULT_FRESHNESS_DAYS;
    bool refine = false;                                 // Run Stage-2 refinement.
    size_t refine_batch_size = DEFAULT_REFINE_BATCH_SIZE;
    size_t min_tokens = DEFAULT_MIN_TOKENS;
    size_t max_tokens = DEFAULT_MAX_TOKENS;
    bool deduplicate = false;
    float dedup_threshold = DEFAULT_DEDUP_THRESHOLD;
    int source_timeout_seconds = DEFAULT_SOURCE_TIMEOUT_SECONDS;
    EmbeddingSettings embedding;
    RefinerSettings refiner;
    std::map<std::string, std::vector<Source>> subjects;  // Display name -> sources.

    int64_t freshness_window_seconds() const { return freshness_days * SECONDS_PER_DAY; }
};

/**
 * Loads settings from path. Returns empty optional if the file doesn't
 * exist; throws ConfigError if it exists but is malformed.
 */
std::optional<Settings> load_settings(const std::string& path = SETTINGS_FILE);

// Saves settings to path. Throws std::runtime_error if the file can't be written.
void save_settings(const Settings& settings, const std::string& path = SETTINGS_FILE);

/**
 * Returns the sources configured for subject, matching names
 * case-insensitively. Returns nullptr if the subject is not configured.
 */
const std::vector<Source>* find_subject_sources(const Settings& settings, const std::string& subject);

} // namespace quarry
