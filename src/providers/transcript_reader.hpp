#pragma once

/**
 * Transcriber that reads prepared transcripts from local files.
 *
 * Speech-to-text runs outside quarry; its output is dropped next to the
 * configured source. Whisper-style JSON ({"text", "segments": [{"start",
 * "text"}]}) keeps segment timing; any other file is taken as plain text.
 */

#include "provider.hpp"
#include <nlohmann/json.hpp>

namespace quarry::providers {

class TranscriptFileReader : public ITranscriber {
public:
    /**
     * Reads the transcript at location (a path or file:// URL). Throws
     * SourceUnavailableError if the file is missing, empty, or malformed.
     */
    Transcript transcribe(const std::string& location, const FetchOptions& options) override;
};

// Parses a Whisper-style JSON transcript. Throws std::invalid_argument if malformed.
Transcript parse_whisper_json(const nlohmann::json& j);

} // namespace quarry::providers
