#pragma once

/**
 * Top-level facade over the quarry core.
 *
 * Owns the registry, the question index, the decision policy and the
 * ingestion service for one data directory, and exposes the caller-facing
 * operations used by the CLI and the HTTP server. State is loaded in the
 * constructor and flushed by flush() and the destructor.
 */

#include "decision_policy.hpp"
#include "ingestion.hpp"
#include "question_index.hpp"
#include "registry.hpp"
#include "retriever.hpp"
#include "settings.hpp"
#include "sources.hpp"
#include "providers/provider.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quarry {

/**
 * Result of ask(): what was decided, what was ingested, what matched.
 */
struct AskResult {
    Decision decision;
    std::optional<IngestionReport> ingestion;  // Set when an ingestion ran.
    std::vector<Match> matches;
};

class Engine {
public:
    /**
     * Loads the registry from settings.data_dir. The embedder, fetcher and
     * transcriber must be set; the refiner is optional. Throws
     * RegistryCorruptError if the registry file is unreadable as a whole.
     */
    Engine(Settings settings,
           providers::Collaborators collaborators,
           std::unique_ptr<IDecisionScorer> scorer = nullptr);

    // Flushes unsaved index changes; failures are logged.
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ========== Decisions ==========

    Decision decide(const std::string& subject, bool force = false);
    Decision decide(const std::string& subject, bool force, int64_t now);

    // ========== Ingestion ==========

    /**
     * Ingests the sources configured for subject in the settings file.
     * Throws ConfigError if none are configured.
     */
    IngestionReport ingest(const std::string& subject, IngestMode mode = IngestMode::Full);

    // Ingests an explicit source list.
    IngestionReport ingest(const std::string& subject,
                           const std::vector<Source>& sources,
                           IngestMode mode,
                           int64_t now,
                           providers::CancelCallback cancel_check = nullptr);

    // ========== Retrieval ==========

    std::vector<Match> retrieve(const std::string& subject, const std::string& query,
                                size_t k, float threshold) const;

    // Uses top_k and similarity_threshold from the settings.
    std::vector<Match> retrieve(const std::string& subject, const std::string& query) const;

    /**
     * Decides, ingests the configured sources if the decision requires it,
     * then retrieves. A subject without configured sources is searched as
     * is, with a warning when ingestion was due.
     */
    AskResult ask(const std::string& subject,
                  const std::string& question,
                  bool force = false,
                  std::optional<size_t> k = std::nullopt,
                  std::optional<float> threshold = std::nullopt);

    // ========== Maintenance ==========

    // Registry entries ordered by subject key.
    std::vector<RegistryEntry> status() const;

    // Subject keys with unreadable registry entries.
    std::vector<std::string> corrupt_subjects() const;

    IndexStats stats(const std::string& subject) const;

    // Records of a subject in id order.
    std::vector<QuestionRecord> records(const std::string& subject) const;

    /**
     * Removes a subject's records and registry entry, waiting for any
     * ingestion of the subject to finish first. Ids are not reused
     * afterwards. Returns the number of records removed.
     */
    size_t reset(const std::string& subject);

    // Persists the index and the registry.
    void flush();

    const Settings& settings() const { return settings_; }
    providers::IEmbedder& embedder() { return *collaborators_.embedder; }

    // Current Unix time in seconds.
    static int64_t unix_now();

private:
    Settings settings_;
    providers::Collaborators collaborators_;
    EntityRegistry registry_;
    QuestionIndex index_;
    DecisionPolicy policy_;
    SourceReader reader_;
    IngestionService ingestion_;
    Retriever retriever_;
};

} // namespace quarry
