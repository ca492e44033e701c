#pragma once

/**
 * Common types for collaborator interfaces.
 *
 * These types are collaborator-agnostic and shared by every fetcher,
 * transcriber, embedder and refiner implementation.
 */

#include <functional>
#include <string>
#include <vector>

namespace quarry::providers {

/**
 * Callback to check if cancellation has been requested.
 * Returns true if the operation should be cancelled.
 */
using CancelCallback = std::function<bool()>;

/**
 * Per-request limits for a single source fetch.
 */
struct FetchOptions {
    int timeout_seconds = 60;      // Whole-request timeout; 0 disables.
    CancelCallback cancel_check;   // Optional; returns true to abort.
};

/**
 * A transcript span with its start offset in the media.
 */
struct TranscriptSegment {
    double start_seconds = 0.0;
    std::string text;
};

/**
 * Output of a transcription collaborator.
 *
 * segments may be empty when the transcript carries no timing.
 */
struct Transcript {
    std::string text;
    std::vector<TranscriptSegment> segments;
};

/**
 * Token usage reported by a metered collaborator call.
 */
struct TokenUsage {
    int input_tokens = 0;
    int output_tokens = 0;
};

} // namespace quarry::providers
