#pragma once

/**
 * OpenAI collaborator implementations.
 *
 * OpenAIEmbedder calls the Embeddings API; ChatRefiner runs Stage-2
 * question refinement through Chat Completions. Both speak to any
 * OpenAI-compatible server through the configured base URL.
 */

#include "../provider.hpp"
#include "../../openai_client.hpp"
#include "../../usage_tracker.hpp"
#include <string>
#include <vector>

namespace quarry::providers::openai {

/**
 * Embedder backed by the OpenAI Embeddings API.
 */
class OpenAIEmbedder : public IEmbedder {
public:
    OpenAIEmbedder(const std::string& api_key,
                   const std::string& base_url,
                   const std::string& model,
                   size_t dimension);

    std::vector<float> embed(const std::string& text) override;
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
    size_t dimension() const override { return dimension_; }
    std::string model() const override { return model_; }

private:
    OpenAIClient client_;
    std::string model_;
    size_t dimension_;
};

/**
 * Stage-2 refiner backed by a chat model.
 *
 * The batch is sent as a JSON array and the model must answer with a JSON
 * array of cleaned questions. Token usage of every call is recorded in the
 * usage tracker under the "refinement" purpose.
 */
class ChatRefiner : public IRefiner {
public:
    ChatRefiner(const std::string& api_key,
                const std::string& base_url,
                const std::string& model,
                UsageTracker& usage);

    std::vector<std::string> refine(const std::vector<std::string>& batch) override;

private:
    OpenAIClient client_;
    std::string model_;
    UsageTracker& usage_;
};

// Parses the first JSON array of strings embedded in a model reply.
// Throws RefinementError if none is found.
std::vector<std::string> parse_refined_questions(const std::string& reply);

} // namespace quarry::providers::openai
