#pragma once

/**
 * OpenAI-compatible API client for quarry.
 *
 * Provides the Embeddings and Chat Completions calls used by the embedding
 * and refinement collaborators, using libcurl for HTTP transport. Any
 * server speaking the same wire format can be targeted through base_url.
 */

#include "providers/types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace quarry {

/**
 * Text and token usage of a chat completion.
 */
struct ChatCompletion {
    std::string content;
    providers::TokenUsage usage;
};

/**
 * HTTP client for OpenAI API interactions.
 *
 * Handles authentication, request formatting, and response parsing. Every
 * method throws std::runtime_error on transport failures, HTTP errors, or
 * unexpected response bodies.
 */
class OpenAIClient {
public:
    // Creates a client with the given API key and base URL (no trailing slash).
    OpenAIClient(const std::string& api_key, const std::string& base_url, int timeout_seconds = 60);

    // Cleans up CURL global state.
    ~OpenAIClient();

    OpenAIClient(const OpenAIClient&) = delete;
    OpenAIClient& operator=(const OpenAIClient&) = delete;

    // ========== Embeddings API ==========

    // Embeds texts in one request. dimensions is sent only when non-zero.
    // Vectors are returned in input order.
    std::vector<std::vector<float>> create_embeddings(const std::string& model,
                                                      const std::vector<std::string>& texts,
                                                      size_t dimensions = 0);

    // ========== Chat Completions API ==========

    // Runs a single-turn completion with a system and a user message.
    ChatCompletion chat_completion(const std::string& model,
                                   const std::string& system_prompt,
                                   const std::string& user_prompt);

private:
    std::string api_key_;   // OpenAI API key.
    std::string base_url_;  // e.g. https://api.openai.com/v1
    int timeout_seconds_;

    // ========== HTTP Helpers ==========

    // Performs an HTTP POST with JSON body and returns the parsed response.
    nlohmann::json http_post_json(const std::string& url, const nlohmann::json& body);
};

} // namespace quarry
