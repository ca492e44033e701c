#pragma once

/**
 * Two-stage question extraction.
 *
 * Stage 1 turns source text into heuristic candidates with provenance.
 * Stage 2 hands fixed-size batches of candidate strings to the refinement
 * collaborator. A failing batch falls back to its Stage-1 candidates and
 * the run is flagged as heuristics-only instead of failing.
 */

#include "question_extractor.hpp"
#include "question_record.hpp"
#include "sources.hpp"
#include "providers/provider.hpp"
#include <string>
#include <vector>

namespace quarry {

/**
 * A question string together with where it was asked.
 */
struct Candidate {
    std::string text;
    SourceRef source;
};

struct ExtractionOptions {
    ExtractionLimits limits;
    size_t batch_size = DEFAULT_REFINE_BATCH_SIZE;
};

/**
 * Output of one extraction run over a source.
 */
struct ExtractionResult {
    std::vector<Candidate> questions;
    size_t stage1_count = 0;       // Candidates produced by Stage 1.
    size_t batches = 0;            // Batches sent to the refiner.
    size_t degraded_batches = 0;   // Batches that fell back to Stage 1.

    bool heuristics_only() const { return degraded_batches > 0; }
};

class ExtractionPipeline {
public:
    // refiner may be null; Stage 2 is then skipped.
    ExtractionPipeline(ExtractionOptions options, providers::IRefiner* refiner = nullptr);

    /**
     * Stage 1. Articles in Q&A format yield their interviewer lines;
     * timestamped transcripts are scanned per segment so each candidate
     * carries the segment start as media timestamp; everything else is
     * scanned sentence by sentence.
     */
    std::vector<Candidate> generate_candidates(const SourceText& source) const;

    /**
     * Stage 2 over already generated candidates, in batches of
     * options.batch_size. Output order follows refiner output per batch.
     */
    ExtractionResult refine(const std::vector<Candidate>& candidates);

    // Stage 1 followed by Stage 2.
    ExtractionResult run(const SourceText& source);

    bool refinement_enabled() const { return refiner_ != nullptr; }

private:
    // Refines one batch; throws on collaborator failure or contract breach.
    std::vector<Candidate> refine_batch(const std::vector<Candidate>& batch);

    ExtractionOptions options_;
    QuestionExtractor extractor_;
    providers::IRefiner* refiner_;
};

} // namespace quarry
