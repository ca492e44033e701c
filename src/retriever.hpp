#pragma once

/**
 * Similarity retrieval over a subject's question index.
 */

#include "config.hpp"
#include "question_index.hpp"
#include "providers/provider.hpp"
#include <string>
#include <vector>

namespace quarry {

class Retriever {
public:
    Retriever(const QuestionIndex& index, providers::IEmbedder& embedder,
              size_t over_fetch_factor = DEFAULT_OVER_FETCH_FACTOR);

    /**
     * Returns at most k stored questions whose similarity to query is at
     * least threshold, best first. The result is never padded with weaker
     * matches. Throws QueryEmbeddingError if query is blank or cannot be
     * embedded; IndexCorruptError if the subject is corrupt.
     */
    std::vector<Match> retrieve(const std::string& subject, const std::string& query,
                                size_t k, float threshold) const;

private:
    const QuestionIndex& index_;
    providers::IEmbedder& embedder_;
    size_t over_fetch_factor_;
};

} // namespace quarry
