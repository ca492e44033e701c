#pragma once

/**
 * Stage-1 question candidate generation.
 *
 * Pure heuristics, no external calls. Tuned for recall: declarative
 * sentences are dropped, but rhetorical questions and fragments may pass
 * and are left for Stage-2 refinement.
 */

#include "config.hpp"
#include <string>
#include <vector>

namespace quarry {

/**
 * Token-length window for a candidate sentence.
 */
struct ExtractionLimits {
    size_t min_tokens = DEFAULT_MIN_TOKENS;
    size_t max_tokens = DEFAULT_MAX_TOKENS;
};

// Splits text into sentences at whitespace that follows '.', '!' or '?'.
// Sentences are trimmed; empty ones are dropped.
std::vector<std::string> split_sentences(const std::string& text);

// Splits a sentence into whitespace-separated tokens.
std::vector<std::string> split_tokens(const std::string& sentence);

// Strips leading and trailing whitespace.
std::string trim(const std::string& s);

/**
 * Heuristic question extractor.
 */
class QuestionExtractor {
public:
    explicit QuestionExtractor(ExtractionLimits limits = {});

    /**
     * Returns true if the sentence ends with '?' or starts with an
     * interrogative word, and its token count is within the limits.
     */
    bool is_candidate(const std::string& sentence) const;

    // Runs is_candidate() over every sentence of text, preserving order.
    std::vector<std::string> extract(const std::string& text) const;

    /**
     * Extracts interviewer lines from Q&A-formatted articles
     * ("Q: ...", "Question: ...", "Interviewer: ...", "**Q:** ...").
     * Whitespace is collapsed and a '?' appended when missing. Returns an
     * empty list when the text has no such lines.
     */
    std::vector<std::string> extract_qa(const std::string& text) const;

    const ExtractionLimits& limits() const { return limits_; }

private:
    ExtractionLimits limits_;
};

} // namespace quarry
