#include "ingestion.hpp"
#include "deduplicator.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <set>

namespace quarry {

std::string to_string(IngestMode mode) {
    return mode == IngestMode::Incremental ? "incremental" : "full";
}

IngestionService::IngestionService(QuestionIndex& index,
                                   EntityRegistry& registry,
                                   providers::IEmbedder& embedder,
                                   SourceReader& reader,
                                   providers::IRefiner* refiner,
                                   IngestionOptions options)
    : index_(index),
      registry_(registry),
      embedder_(embedder),
      reader_(reader),
      pipeline_(options.extraction, refiner),
      options_(options) {}

std::mutex& IngestionService::subject_mutex(const std::string& key) {
    std::lock_guard<std::mutex> lock(subject_mutexes_guard_);
    auto& slot = subject_mutexes_[key];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::unique_lock<std::mutex> IngestionService::lock_subject(const std::string& subject) {
    return std::unique_lock<std::mutex>(subject_mutex(subject_key(subject)));
}

void IngestionService::embed_candidates(const std::vector<Candidate>& candidates,
                                        std::vector<EmbeddedCandidate>& out,
                                        IngestionReport& report) {
    if (candidates.empty()) {
        return;
    }

    std::vector<std::string> texts;
    texts.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        texts.push_back(candidate.text);
    }

    try {
        std::vector<std::vector<float>> vectors = embedder_.embed_batch(texts);
        if (vectors.size() != candidates.size()) {
            throw EmbeddingError("embedder returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(candidates.size()) + " texts");
        }
        for (size_t i = 0; i < candidates.size(); ++i) {
            out.push_back({candidates[i], std::move(vectors[i])});
        }
        return;
    } catch (const std::exception& e) {
        verbose_err("INGEST", std::string("Batch embedding failed, retrying one by one: ") + e.what());
    }

    for (const auto& candidate : candidates) {
        try {
            out.push_back({candidate, embedder_.embed(candidate.text)});
        } catch (const std::exception& e) {
            warn_log("INGEST", "Skipping question '" + truncate(candidate.text, 80) +
                     "': " + e.what());
            ++report.embedding_failures;
        }
    }
}

IngestionReport IngestionService::ingest(const std::string& subject,
                                         const std::vector<Source>& sources,
                                         IngestMode mode,
                                         int64_t now,
                                         providers::CancelCallback cancel_check) {
    std::string key = subject_key(subject);
    std::unique_lock<std::mutex> run_lock = lock_subject(subject);

    IngestionReport report;
    report.subject_id = key;
    report.mode = mode;

    // Fails fast for a corrupt subject before any source is fetched
    std::optional<RegistryEntry> existing = registry_.get(subject);
    index_.count(subject);

    std::set<std::string> known;
    if (mode == IngestMode::Incremental && existing) {
        known.insert(existing->sources.begin(), existing->sources.end());
    }

    providers::FetchOptions fetch_options;
    fetch_options.timeout_seconds = options_.source_timeout_seconds;
    fetch_options.cancel_check = cancel_check;

    RegistryDelta delta;
    delta.display_name = subject;
    std::vector<EmbeddedCandidate> embedded;

    // ========== Read, extract, refine, embed ==========

    for (const auto& source : sources) {
        std::string url = source_url(source);
        if (known.count(url) > 0) {
            verbose_log("INGEST", "Already ingested, skipping: " + url);
            ++report.known_sources_skipped;
            continue;
        }

        SourceText text;
        try {
            text = reader_.read(source, fetch_options);
        } catch (const SourceUnavailableError& e) {
            warn_log("INGEST", "Skipping source " + url + ": " + e.what());
            report.unavailable_sources.push_back(url);
            continue;
        }

        ExtractionResult extraction = pipeline_.run(text);
        if (extraction.heuristics_only()) {
            report.degraded = true;
        }
        report.candidates += extraction.questions.size();
        report.sources_ingested.add(text.source.type);
        delta.source_counts.add(text.source.type);
        delta.sources.push_back(url);
        known.insert(url);

        verbose_log("INGEST", url + ": " + std::to_string(extraction.stage1_count) + " candidates, " +
                    std::to_string(extraction.questions.size()) + " after refinement");

        embed_candidates(extraction.questions, embedded, report);
    }

    // ========== Group ==========

    std::vector<std::vector<size_t>> groups;
    if (options_.deduplicate) {
        std::vector<std::vector<float>> vectors;
        vectors.reserve(embedded.size());
        for (const auto& item : embedded) {
            vectors.push_back(item.vector);
        }
        groups = group_near_duplicates(vectors, options_.dedup_threshold);
        report.merged = embedded.size() - groups.size();
        if (report.merged > 0) {
            verbose_log("INGEST", "Deduplication merged " + std::to_string(report.merged) +
                        " near-duplicate questions");
        }
    } else {
        for (size_t i = 0; i < embedded.size(); ++i) {
            groups.push_back({i});
        }
    }

    // ========== Commit ==========

    for (const auto& group : groups) {
        const EmbeddedCandidate& lead = embedded[group.front()];

        QuestionRecord record;
        record.text = lead.candidate.text;
        record.captured_at = now;
        for (size_t member : group) {
            record.sources.push_back(embedded[member].candidate.source);
        }

        try {
            index_.commit(subject, record, lead.vector);
            ++report.questions_added;
            report.questions_by_type.add(record.primary_source().type);
        } catch (const IndexWriteError& e) {
            warn_log("INGEST", e.what());
            ++report.write_failures;
        }
    }

    index_.flush(subject);

    delta.question_count = static_cast<int64_t>(report.questions_added);
    delta.degraded = report.degraded;
    report.entry = registry_.upsert(subject, delta, now);
    try {
        registry_.flush();
    } catch (const std::exception& e) {
        throw IndexWriteError("Cannot persist registry: " + std::string(e.what()));
    }

    verbose_log("INGEST", "Run for '" + key + "' (" + to_string(mode) + ") added " +
                std::to_string(report.questions_added) + " questions from " +
                std::to_string(report.sources_ingested.total()) + " sources");
    return report;
}

} // namespace quarry
