#include "hashing_embedder.hpp"
#include "../errors.hpp"
#include "../vector_store.hpp"
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace quarry::providers {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 1469598103934665603ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;
constexpr float BIGRAM_WEIGHT = 0.5f;

uint64_t fnv1a(const std::string& s) {
    uint64_t hash = FNV_OFFSET_BASIS;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

} // namespace

std::vector<std::string> embedding_terms(const std::string& text) {
    std::vector<std::string> terms;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (ch == '\'') {
            continue;
        } else if (!current.empty()) {
            terms.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        terms.push_back(current);
    }
    return terms;
}

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("HashingEmbedder dimension must be positive");
    }
}

std::vector<float> HashingEmbedder::embed(const std::string& text) {
    std::vector<std::string> terms = embedding_terms(text);
    if (terms.empty()) {
        throw EmbeddingError("Cannot embed text without words");
    }

    std::vector<float> v(dimension_, 0.0f);
    auto add = [&](const std::string& feature, float weight) {
        uint64_t hash = fnv1a(feature);
        size_t bucket = static_cast<size_t>(hash % dimension_);
        float sign = (hash >> 63) ? -1.0f : 1.0f;
        v[bucket] += sign * weight;
    };

    for (size_t i = 0; i < terms.size(); ++i) {
        add(terms[i], 1.0f);
        if (i + 1 < terms.size()) {
            add(terms[i] + " " + terms[i + 1], BIGRAM_WEIGHT);
        }
    }

    if (!normalize(v)) {
        // Every feature cancelled out; fall back to the first term's bucket
        v[static_cast<size_t>(fnv1a(terms.front()) % dimension_)] = 1.0f;
    }
    return v;
}

} // namespace quarry::providers
