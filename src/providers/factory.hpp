#pragma once

/**
 * Factory for creating collaborator instances from settings.
 */

#include "provider.hpp"
#include "../errors.hpp"
#include "../settings.hpp"
#include "../usage_tracker.hpp"
#include <memory>
#include <optional>
#include <string>

namespace quarry::providers {

/**
 * Exception thrown when a collaborator is not available or configured.
 */
class ProviderNotAvailableError : public QuarryError {
public:
    explicit ProviderNotAvailableError(const std::string& message)
        : QuarryError(message) {}
};

/**
 * Factory for creating collaborator instances.
 */
class ProviderFactory {
public:
    /**
     * Creates the embedder named by settings.embedding.provider.
     * Throws ProviderNotAvailableError for an unknown provider or a
     * missing API key.
     */
    static std::unique_ptr<IEmbedder> create_embedder(const EmbeddingSettings& settings);

    /**
     * Creates the full collaborator set. The refiner is created only when
     * settings.refine is set; usage must outlive the refiner.
     */
    static Collaborators create(const Settings& settings, UsageTracker& usage);

    /**
     * Returns the OpenAI API key from the environment, checking
     * OPENAI_API_KEY then OPEN_AI_API_KEY.
     */
    static std::optional<std::string> api_key_from_environment();
};

} // namespace quarry::providers
