#include "factory.hpp"
#include "hashing_embedder.hpp"
#include "http_fetcher.hpp"
#include "transcript_reader.hpp"
#include "openai/openai_provider.hpp"
#include "../verbose.hpp"
#include <cstdlib>

namespace quarry::providers {

std::optional<std::string> ProviderFactory::api_key_from_environment() {
    const char* key = std::getenv("OPENAI_API_KEY");
    if (!key) {
        key = std::getenv("OPEN_AI_API_KEY");  // Legacy name
    }
    if (key && key[0] != '\0') {
        return std::string(key);
    }
    return std::nullopt;
}

std::unique_ptr<IEmbedder> ProviderFactory::create_embedder(const EmbeddingSettings& settings) {
    if (settings.provider == "hashing") {
        return std::make_unique<HashingEmbedder>(settings.dimension);
    }

    if (settings.provider == "openai") {
        auto key = api_key_from_environment();
        if (!key) {
            throw ProviderNotAvailableError(
                "Embedding provider 'openai' needs an API key. Set OPENAI_API_KEY environment variable."
            );
        }
        return std::make_unique<openai::OpenAIEmbedder>(*key, settings.base_url, settings.model,
                                                        settings.dimension);
    }

    throw ProviderNotAvailableError("Unknown embedding provider '" + settings.provider +
                                    "' (expected 'hashing' or 'openai')");
}

Collaborators ProviderFactory::create(const Settings& settings, UsageTracker& usage) {
    Collaborators collaborators;
    collaborators.embedder = create_embedder(settings.embedding);
    collaborators.fetcher = std::make_unique<HttpFetcher>();
    collaborators.transcriber = std::make_unique<TranscriptFileReader>();

    if (settings.refine) {
        auto key = api_key_from_environment();
        if (key) {
            collaborators.refiner = std::make_unique<openai::ChatRefiner>(
                *key, settings.refiner.base_url, settings.refiner.model, usage);
        } else {
            warn_log("PROVIDER", "Refinement enabled but no API key is set; running heuristics only");
        }
    }

    verbose_log("PROVIDER", "Embedder: " + collaborators.embedder->model() + " (" +
                std::to_string(collaborators.embedder->dimension()) + " dims), refiner: " +
                (collaborators.refiner ? settings.refiner.model : std::string("none")));
    return collaborators;
}

} // namespace quarry::providers
