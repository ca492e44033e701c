#include "extraction_pipeline.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <algorithm>

namespace quarry {

ExtractionPipeline::ExtractionPipeline(ExtractionOptions options, providers::IRefiner* refiner)
    : options_(options),
      extractor_(options.limits),
      refiner_(refiner) {
    if (options_.batch_size == 0) {
        options_.batch_size = DEFAULT_REFINE_BATCH_SIZE;
    }
}

std::vector<Candidate> ExtractionPipeline::generate_candidates(const SourceText& source) const {
    std::vector<Candidate> candidates;

    if (source.source.type == SourceType::Article) {
        std::vector<std::string> qa = extractor_.extract_qa(source.text);
        if (!qa.empty()) {
            verbose_log("EXTRACT", "Q&A format detected in " + source.source.url + ": " +
                        std::to_string(qa.size()) + " lines");
            for (auto& text : qa) {
                candidates.push_back({std::move(text), source.source});
            }
            return candidates;
        }
    }

    if (!source.segments.empty()) {
        for (const auto& segment : source.segments) {
            for (auto& text : extractor_.extract(segment.text)) {
                Candidate candidate{std::move(text), source.source};
                candidate.source.media_timestamp = segment.start_seconds;
                candidates.push_back(std::move(candidate));
            }
        }
    } else {
        for (auto& text : extractor_.extract(source.text)) {
            candidates.push_back({std::move(text), source.source});
        }
    }

    verbose_log("EXTRACT", "Stage 1: " + std::to_string(candidates.size()) +
                " candidates from " + source.source.url);
    return candidates;
}

std::vector<Candidate> ExtractionPipeline::refine_batch(const std::vector<Candidate>& batch) {
    std::vector<std::string> texts;
    texts.reserve(batch.size());
    for (const auto& candidate : batch) {
        texts.push_back(candidate.text);
    }

    std::vector<std::string> refined = refiner_->refine(texts);
    if (refined.size() > texts.size()) {
        throw RefinementError("refiner returned " + std::to_string(refined.size()) +
                              " strings for a batch of " + std::to_string(texts.size()));
    }

    // Re-attach provenance: an unchanged string keeps its own source, a
    // rewritten or merged one takes the first unclaimed candidate's.
    std::vector<std::string> cleaned;
    for (const auto& raw : refined) {
        std::string text = trim(raw);
        if (!text.empty()) {
            cleaned.push_back(std::move(text));
        }
    }

    const size_t unassigned = batch.size();
    std::vector<bool> claimed(batch.size(), false);
    std::vector<size_t> slots(cleaned.size(), unassigned);
    for (size_t r = 0; r < cleaned.size(); ++r) {
        for (size_t i = 0; i < batch.size(); ++i) {
            if (!claimed[i] && batch[i].text == cleaned[r]) {
                claimed[i] = true;
                slots[r] = i;
                break;
            }
        }
    }
    for (size_t r = 0; r < cleaned.size(); ++r) {
        if (slots[r] == unassigned) {
            auto it = std::find(claimed.begin(), claimed.end(), false);
            slots[r] = static_cast<size_t>(it - claimed.begin());
            claimed[slots[r]] = true;
        }
    }

    std::vector<Candidate> out;
    out.reserve(cleaned.size());
    for (size_t r = 0; r < cleaned.size(); ++r) {
        out.push_back({cleaned[r], batch[slots[r]].source});
    }
    return out;
}

ExtractionResult ExtractionPipeline::refine(const std::vector<Candidate>& candidates) {
    ExtractionResult result;
    result.stage1_count = candidates.size();

    if (!refiner_ || candidates.empty()) {
        result.questions = candidates;
        return result;
    }

    for (size_t start = 0; start < candidates.size(); start += options_.batch_size) {
        size_t end = std::min(candidates.size(), start + options_.batch_size);
        std::vector<Candidate> batch(candidates.begin() + start, candidates.begin() + end);
        ++result.batches;

        try {
            std::vector<Candidate> refined = refine_batch(batch);
            verbose_log("EXTRACT", "Stage 2 batch " + std::to_string(result.batches) + ": " +
                        std::to_string(batch.size()) + " -> " + std::to_string(refined.size()));
            result.questions.insert(result.questions.end(), refined.begin(), refined.end());
        } catch (const std::exception& e) {
            warn_log("EXTRACT", "Refinement failed for batch " + std::to_string(result.batches) +
                     ", keeping heuristic candidates: " + e.what());
            ++result.degraded_batches;
            result.questions.insert(result.questions.end(), batch.begin(), batch.end());
        }
    }
    return result;
}

ExtractionResult ExtractionPipeline::run(const SourceText& source) {
    return refine(generate_candidates(source));
}

} // namespace quarry
