#pragma once

/**
 * Application configuration constants.
 *
 * Defines file paths, tuning defaults and the interrogative vocabulary used
 * by the quarry index. Every default here can be overridden from the
 * settings file (see settings.hpp).
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>

namespace quarry {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".quarry.json";   // Local settings file.
constexpr const char* DEFAULT_DATA_DIR = "data";         // Root of all persisted state.
constexpr const char* REGISTRY_FILE = "registry.json";   // Registry file inside data_dir.
constexpr const char* VECTOR_DIR = "vectors";            // Per-subject vector files.
constexpr const char* METADATA_DIR = "metadata";         // Per-subject metadata files.
constexpr const char* VECTOR_FILE_EXTENSION = ".qvec";
constexpr const char* METADATA_FILE_EXTENSION = ".json";

// ========== Retrieval ==========

// Minimum cosine similarity for a stored question to count as a match.
// Fit for sentence-embedding models of the MiniLM family; models with a
// tighter similarity distribution want a higher value (around 0.8).
constexpr float DEFAULT_SIMILARITY_THRESHOLD = 0.50f;
constexpr size_t DEFAULT_OVER_FETCH_FACTOR = 4;
constexpr size_t DEFAULT_TOP_K = 5;

// ========== Freshness ==========

constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t DEFAULT_FRESHNESS_DAYS = 30;

// ========== Extraction ==========

constexpr size_t DEFAULT_MIN_TOKENS = 2;
constexpr size_t DEFAULT_MAX_TOKENS = 200;
constexpr size_t DEFAULT_REFINE_BATCH_SIZE = 30;
constexpr size_t QA_MIN_TOKENS = 5;          // Q&A-format lines shorter than this are noise.
constexpr float DEFAULT_DEDUP_THRESHOLD = 0.85f;

// A sentence starting with one of these words is a question candidate.
inline const std::unordered_set<std::string> INTERROGATIVE_WORDS = {
    "what", "why", "how", "when", "where", "who", "which",
    "would", "could", "can", "do", "does", "did", "is", "are"
};

// ========== Sources ==========

constexpr int DEFAULT_SOURCE_TIMEOUT_SECONDS = 60;

// ========== Embedding / Refinement ==========

constexpr const char* OPENAI_API_BASE = "https://api.openai.com/v1";  // OpenAI-compatible base URL.
constexpr const char* DEFAULT_EMBEDDING_PROVIDER = "hashing";
constexpr const char* DEFAULT_EMBEDDING_MODEL = "text-embedding-3-small";
constexpr size_t DEFAULT_EMBEDDING_DIMENSION = 384;
constexpr const char* DEFAULT_REFINER_MODEL = "gpt-4o-mini";

// Tolerance on |v| - 1 for vectors accepted by the vector store.
constexpr float NORM_TOLERANCE = 1e-3f;

} // namespace quarry
