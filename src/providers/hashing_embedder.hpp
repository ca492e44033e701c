#pragma once

/**
 * Deterministic local embedder based on feature hashing.
 *
 * Lower-cased alphanumeric words and adjacent word pairs are hashed into a
 * fixed number of signed buckets and the result is L2-normalized. Texts
 * sharing vocabulary score high; no model or network is needed, which makes
 * it the offline default.
 */

#include "provider.hpp"

namespace quarry::providers {

class HashingEmbedder : public IEmbedder {
public:
    explicit HashingEmbedder(size_t dimension);

    std::vector<float> embed(const std::string& text) override;
    size_t dimension() const override { return dimension_; }
    std::string model() const override { return "hashing-v1"; }

private:
    size_t dimension_;
};

// Lower-cased alphanumeric words of text, apostrophes dropped.
std::vector<std::string> embedding_terms(const std::string& text);

} // namespace quarry::providers
