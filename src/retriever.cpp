#include "retriever.hpp"
#include "errors.hpp"
#include "question_extractor.hpp"
#include "verbose.hpp"
#include <limits>

namespace quarry {

Retriever::Retriever(const QuestionIndex& index, providers::IEmbedder& embedder,
                     size_t over_fetch_factor)
    : index_(index),
      embedder_(embedder),
      over_fetch_factor_(over_fetch_factor == 0 ? 1 : over_fetch_factor) {}

std::vector<Match> Retriever::retrieve(const std::string& subject, const std::string& query,
                                       size_t k, float threshold) const {
    if (k == 0) {
        return {};
    }

    std::string text = trim(query);
    if (text.empty()) {
        throw QueryEmbeddingError("Query text is empty");
    }

    std::vector<float> vector;
    try {
        vector = embedder_.embed(text);
    } catch (const std::exception& e) {
        throw QueryEmbeddingError(std::string("Cannot embed query: ") + e.what());
    }
    if (vector.size() != index_.dimension()) {
        throw QueryEmbeddingError("Query embedding has dimension " + std::to_string(vector.size()) +
                                  ", index expects " + std::to_string(index_.dimension()));
    }

    size_t over_k = k > std::numeric_limits<size_t>::max() / over_fetch_factor_
        ? std::numeric_limits<size_t>::max()
        : k * over_fetch_factor_;
    std::vector<Match> candidates = index_.search(subject, vector, over_k);

    std::vector<Match> matches;
    for (auto& match : candidates) {
        if (match.score < threshold) {
            // Candidates are sorted, so nothing further can pass
            break;
        }
        matches.push_back(std::move(match));
        if (matches.size() == k) {
            break;
        }
    }

    verbose_log("RETRIEVE", "'" + truncate(text, 80) + "' on '" + subject_key(subject) + "': " +
                std::to_string(candidates.size()) + " fetched, " + std::to_string(matches.size()) +
                " above " + std::to_string(threshold));
    return matches;
}

} // namespace quarry
