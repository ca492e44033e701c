#include "engine.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace quarry {

static providers::Collaborators require_collaborators(providers::Collaborators collaborators) {
    if (!collaborators.embedder || !collaborators.fetcher || !collaborators.transcriber) {
        throw std::invalid_argument("Engine needs an embedder, a fetcher and a transcriber");
    }
    return collaborators;
}

static IngestionOptions ingestion_options(const Settings& settings) {
    IngestionOptions options;
    options.extraction.limits.min_tokens = settings.min_tokens;
    options.extraction.limits.max_tokens = settings.max_tokens;
    options.extraction.batch_size = settings.refine_batch_size;
    options.deduplicate = settings.deduplicate;
    options.dedup_threshold = settings.dedup_threshold;
    options.source_timeout_seconds = settings.source_timeout_seconds;
    return options;
}

int64_t Engine::unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Engine::Engine(Settings settings,
               providers::Collaborators collaborators,
               std::unique_ptr<IDecisionScorer> scorer)
    : settings_(std::move(settings)),
      collaborators_(require_collaborators(std::move(collaborators))),
      registry_((fs::path(settings_.data_dir) / REGISTRY_FILE).string()),
      index_(settings_.data_dir, collaborators_.embedder->dimension()),
      policy_(std::move(scorer)),
      reader_(*collaborators_.fetcher, *collaborators_.transcriber),
      ingestion_(index_, registry_, *collaborators_.embedder, reader_,
                 collaborators_.refiner.get(), ingestion_options(settings_)),
      retriever_(index_, *collaborators_.embedder, settings_.over_fetch_factor) {
    registry_.load();
    verbose_log("ENGINE", "Data directory " + settings_.data_dir + ", embedder " +
                collaborators_.embedder->model() + ", dedup " +
                (settings_.deduplicate ? "on" : "off"));
}

Engine::~Engine() {
    try {
        index_.flush_all();
    } catch (const std::exception& e) {
        warn_log("ENGINE", std::string("Failed to flush index on shutdown: ") + e.what());
    }
}

// ========== Decisions ==========

Decision Engine::decide(const std::string& subject, bool force) {
    return decide(subject, force, unix_now());
}

Decision Engine::decide(const std::string& subject, bool force, int64_t now) {
    DecisionInput input;
    input.subject = subject;
    input.entry = registry_.get(subject);
    input.force = force;
    input.freshness_window_seconds = settings_.freshness_window_seconds();
    input.now = now;

    return policy_.decide(input);
}

// ========== Ingestion ==========

IngestionReport Engine::ingest(const std::string& subject, IngestMode mode) {
    const std::vector<Source>* sources = find_subject_sources(settings_, subject);
    if (!sources) {
        throw ConfigError("No sources configured for '" + subject +
                          "'; add them under \"subjects\" in the settings file");
    }
    return ingest(subject, *sources, mode, unix_now());
}

IngestionReport Engine::ingest(const std::string& subject,
                               const std::vector<Source>& sources,
                               IngestMode mode,
                               int64_t now,
                               providers::CancelCallback cancel_check) {
    return ingestion_.ingest(subject, sources, mode, now, std::move(cancel_check));
}

// ========== Retrieval ==========

std::vector<Match> Engine::retrieve(const std::string& subject, const std::string& query,
                                    size_t k, float threshold) const {
    return retriever_.retrieve(subject, query, k, threshold);
}

std::vector<Match> Engine::retrieve(const std::string& subject, const std::string& query) const {
    return retrieve(subject, query, settings_.top_k, settings_.similarity_threshold);
}

AskResult Engine::ask(const std::string& subject,
                      const std::string& question,
                      bool force,
                      std::optional<size_t> k,
                      std::optional<float> threshold) {
    AskResult result;
    result.decision = decide(subject, force);

    if (result.decision.requires_ingestion()) {
        const std::vector<Source>* sources = find_subject_sources(settings_, subject);
        if (sources) {
            IngestMode mode = result.decision.action == Action::IncrementalIngest
                ? IngestMode::Incremental
                : IngestMode::Full;
            result.ingestion = ingest(subject, *sources, mode, unix_now());
        } else {
            warn_log("ENGINE", "'" + subject + "' needs ingestion but has no configured sources; "
                     "searching existing data only");
        }
    }

    result.matches = retrieve(subject, question,
                              k.value_or(settings_.top_k),
                              threshold.value_or(settings_.similarity_threshold));
    return result;
}

// ========== Maintenance ==========

std::vector<RegistryEntry> Engine::status() const {
    return registry_.list();
}

std::vector<std::string> Engine::corrupt_subjects() const {
    return registry_.corrupt_subjects();
}

IndexStats Engine::stats(const std::string& subject) const {
    return index_.stats(subject);
}

std::vector<QuestionRecord> Engine::records(const std::string& subject) const {
    return index_.records(subject);
}

size_t Engine::reset(const std::string& subject) {
    // Waits for an in-flight ingestion of this subject to finish
    std::unique_lock<std::mutex> run_lock = ingestion_.lock_subject(subject);

    size_t removed = index_.reset(subject);
    registry_.reset(subject);
    registry_.flush();
    verbose_log("ENGINE", "Reset '" + subject_key(subject) + "': " + std::to_string(removed) +
                " records removed");
    return removed;
}

void Engine::flush() {
    index_.flush_all();
    registry_.flush();
}

} // namespace quarry
