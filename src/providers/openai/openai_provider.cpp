#include "openai_provider.hpp"
#include "../../errors.hpp"
#include "../../vector_store.hpp"
#include "../../verbose.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace quarry::providers::openai {

using json = nlohmann::json;

static const char* REFINER_SYSTEM_PROMPT =
    "You clean up interview questions extracted from transcripts and articles.\n"
    "You receive a JSON array of candidate strings. Return a JSON array of strings and nothing else.\n"
    "Rules:\n"
    "- Drop entries that are not genuine questions put to the interviewee (rhetorical asides, "
    "statements, fragments that cannot be repaired).\n"
    "- Rewrite a truncated fragment into a standalone question when its meaning is clear.\n"
    "- Merge entries that ask the same thing into one phrasing.\n"
    "- Keep the original wording when an entry is already a clean question.\n"
    "- Never return more entries than you received.";

// ========== OpenAIEmbedder ==========

OpenAIEmbedder::OpenAIEmbedder(const std::string& api_key,
                               const std::string& base_url,
                               const std::string& model,
                               size_t dimension)
    : client_(api_key, base_url),
      model_(model),
      dimension_(dimension) {}

std::vector<float> OpenAIEmbedder::embed(const std::string& text) {
    std::vector<std::vector<float>> vectors = embed_batch({text});
    return std::move(vectors.front());
}

std::vector<std::vector<float>> OpenAIEmbedder::embed_batch(const std::vector<std::string>& texts) {
    if (texts.empty()) {
        return {};
    }
    for (const auto& text : texts) {
        if (text.empty()) {
            throw EmbeddingError("Cannot embed empty text");
        }
    }

    std::vector<std::vector<float>> vectors;
    try {
        vectors = client_.create_embeddings(model_, texts, dimension_);
    } catch (const std::runtime_error& e) {
        throw EmbeddingError(std::string("Embedding request failed: ") + e.what());
    }

    for (auto& v : vectors) {
        if (v.size() != dimension_) {
            throw EmbeddingError("Model " + model_ + " returned " + std::to_string(v.size()) +
                                 " dimensions, expected " + std::to_string(dimension_));
        }
        if (!normalize(v)) {
            throw EmbeddingError("Model " + model_ + " returned a zero vector");
        }
    }
    return vectors;
}

// ========== ChatRefiner ==========

ChatRefiner::ChatRefiner(const std::string& api_key,
                         const std::string& base_url,
                         const std::string& model,
                         UsageTracker& usage)
    : client_(api_key, base_url),
      model_(model),
      usage_(usage) {}

std::vector<std::string> parse_refined_questions(const std::string& reply) {
    size_t start = reply.find('[');
    size_t end = reply.rfind(']');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        throw RefinementError("Refiner reply holds no JSON array: " + truncate(reply, 200));
    }

    json j;
    try {
        j = json::parse(reply.substr(start, end - start + 1));
    } catch (const json::exception& e) {
        throw RefinementError(std::string("Refiner reply is not valid JSON: ") + e.what());
    }

    std::vector<std::string> questions;
    for (const auto& item : j) {
        if (!item.is_string()) {
            throw RefinementError("Refiner reply contains a non-string entry");
        }
        questions.push_back(item.get<std::string>());
    }
    return questions;
}

std::vector<std::string> ChatRefiner::refine(const std::vector<std::string>& batch) {
    if (batch.empty()) {
        return {};
    }

    json input = batch;
    ChatCompletion completion;
    try {
        completion = client_.chat_completion(model_, REFINER_SYSTEM_PROMPT, input.dump());
    } catch (const std::runtime_error& e) {
        throw RefinementError(std::string("Refinement request failed: ") + e.what());
    }

    usage_.record(model_, "refinement", completion.usage.input_tokens, completion.usage.output_tokens);
    return parse_refined_questions(completion.content);
}

} // namespace quarry::providers::openai
