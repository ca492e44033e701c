#pragma once

/**
 * Ingestion runs: sources in, committed question records out.
 *
 * A run reads each source, extracts and refines questions, embeds them,
 * optionally merges near-duplicates across the whole run, commits records
 * to the dual-store index, flushes the index, and finally records the run
 * in the registry. Runs for one subject are serialized; runs for different
 * subjects proceed in parallel.
 */

#include "config.hpp"
#include "extraction_pipeline.hpp"
#include "question_index.hpp"
#include "registry.hpp"
#include "sources.hpp"
#include "providers/provider.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quarry {

enum class IngestMode {
    Full,        // Read every given source.
    Incremental  // Skip sources whose URL the registry already lists.
};

std::string to_string(IngestMode mode);

struct IngestionOptions {
    ExtractionOptions extraction;
    bool deduplicate = false;
    float dedup_threshold = DEFAULT_DEDUP_THRESHOLD;
    int source_timeout_seconds = DEFAULT_SOURCE_TIMEOUT_SECONDS;
};

/**
 * Outcome of one ingestion run.
 */
struct IngestionReport {
    std::string subject_id;
    IngestMode mode = IngestMode::Full;
    SourceCounts sources_ingested;     // Sources that produced text, by type.
    SourceCounts questions_by_type;    // Committed records, by primary source type.
    size_t candidates = 0;             // Questions surviving extraction and refinement.
    size_t questions_added = 0;        // Records committed.
    size_t merged = 0;                 // Candidates folded into another record by dedup.
    size_t known_sources_skipped = 0;  // Incremental mode only.
    std::vector<std::string> unavailable_sources;
    size_t embedding_failures = 0;
    size_t write_failures = 0;
    bool degraded = false;             // Some refinement batch fell back to heuristics.
    RegistryEntry entry;               // Registry state after the run.
};

class IngestionService {
public:
    /**
     * refiner may be null to run Stage 1 only. All references must outlive
     * the service.
     */
    IngestionService(QuestionIndex& index,
                     EntityRegistry& registry,
                     providers::IEmbedder& embedder,
                     SourceReader& reader,
                     providers::IRefiner* refiner,
                     IngestionOptions options);

    /**
     * Runs one ingestion for subject over sources. Unavailable sources and
     * candidates that fail to embed or commit are skipped and counted.
     * Throws IndexCorruptError or RegistryCorruptError for a corrupt
     * subject, and IndexWriteError if the index cannot be flushed.
     */
    IngestionReport ingest(const std::string& subject,
                           const std::vector<Source>& sources,
                           IngestMode mode,
                           int64_t now,
                           providers::CancelCallback cancel_check = nullptr);

    /**
     * Takes the lock that serializes runs for subject. Hold it to change a
     * subject's index or registry entry without racing an ingestion.
     */
    std::unique_lock<std::mutex> lock_subject(const std::string& subject);

    const IngestionOptions& options() const { return options_; }

private:
    struct EmbeddedCandidate {
        Candidate candidate;
        std::vector<float> vector;
    };

    // Mutex serializing runs for one subject key.
    std::mutex& subject_mutex(const std::string& key);

    // Embeds a batch, falling back to one call per candidate if the batch fails.
    void embed_candidates(const std::vector<Candidate>& candidates,
                          std::vector<EmbeddedCandidate>& out,
                          IngestionReport& report);

    QuestionIndex& index_;
    EntityRegistry& registry_;
    providers::IEmbedder& embedder_;
    SourceReader& reader_;
    ExtractionPipeline pipeline_;
    IngestionOptions options_;

    std::mutex subject_mutexes_guard_;
    std::map<std::string, std::unique_ptr<std::mutex>> subject_mutexes_;
};

} // namespace quarry
