#pragma once

/**
 * Abstract interfaces for the external collaborators of the quarry core.
 *
 * The core consumes plain text and embedding vectors only. How audio is
 * downloaded, how transcription models run, how HTML is parsed, and how an
 * embedding or language model is hosted all live behind these interfaces.
 */

#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace quarry::providers {

/**
 * Turns text into a unit-length vector.
 *
 * Implementations must be deterministic for a given model: the same text
 * always yields the same vector, since stored vectors and query vectors
 * are compared directly.
 */
class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    /**
     * Embeds a single text. The result has dimension() components and an
     * L2 norm of 1. Throws EmbeddingError on failure or empty input.
     */
    virtual std::vector<float> embed(const std::string& text) = 0;

    /**
     * Embeds several texts. The default implementation calls embed() per
     * text; remote implementations override it to batch requests.
     */
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) {
        std::vector<std::vector<float>> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            out.push_back(embed(text));
        }
        return out;
    }

    // Number of components in every vector produced.
    virtual size_t dimension() const = 0;

    // Identifier of the model version, recorded for diagnostics.
    virtual std::string model() const = 0;
};

/**
 * Stage-2 cleanup of question candidates.
 *
 * Receives candidate strings only, never surrounding source text. The
 * returned batch must not be longer than the input; it may drop
 * non-questions, merge near-duplicate phrasings within the batch, and
 * rewrite truncated fragments into standalone questions.
 * Throws RefinementError (or any std::exception) on failure.
 */
class IRefiner {
public:
    virtual ~IRefiner() = default;

    virtual std::vector<std::string> refine(const std::vector<std::string>& batch) = 0;
};

/**
 * Retrieves the raw text of an article or web source.
 * Throws SourceUnavailableError if the source cannot be read.
 */
class IFetcher {
public:
    virtual ~IFetcher() = default;

    virtual std::string fetch(const std::string& url, const FetchOptions& options) = 0;
};

/**
 * Produces a transcript for audio or video media.
 *
 * location is whatever the implementation understands: a media URL, a
 * downloaded audio path, or a prepared transcript file.
 * Throws SourceUnavailableError if no transcript can be produced.
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    virtual Transcript transcribe(const std::string& location, const FetchOptions& options) = 0;
};

/**
 * Owning bundle of the collaborators an Engine runs with.
 * refiner may be null, in which case Stage 2 is skipped.
 */
struct Collaborators {
    std::unique_ptr<IEmbedder> embedder;
    std::unique_ptr<IRefiner> refiner;
    std::unique_ptr<IFetcher> fetcher;
    std::unique_ptr<ITranscriber> transcriber;
};

} // namespace quarry::providers
