#include "transcript_reader.hpp"
#include "../errors.hpp"
#include "../question_extractor.hpp"
#include "../verbose.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace quarry::providers {

using json = nlohmann::json;

Transcript parse_whisper_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("transcript JSON must be an object");
    }

    Transcript transcript;
    if (j.contains("segments")) {
        if (!j["segments"].is_array()) {
            throw std::invalid_argument("'segments' must be an array");
        }
        for (const auto& s : j["segments"]) {
            if (!s.is_object() || !s.contains("text") || !s["text"].is_string()) {
                throw std::invalid_argument("segment without text");
            }
            TranscriptSegment segment;
            segment.start_seconds = s.value("start", 0.0);
            segment.text = trim(s["text"].get<std::string>());
            if (!segment.text.empty()) {
                transcript.segments.push_back(std::move(segment));
            }
        }
    }

    transcript.text = j.value("text", std::string());
    if (transcript.text.empty()) {
        for (const auto& segment : transcript.segments) {
            if (!transcript.text.empty()) {
                transcript.text += ' ';
            }
            transcript.text += segment.text;
        }
    }
    return transcript;
}

Transcript TranscriptFileReader::transcribe(const std::string& location, const FetchOptions& options) {
    if (options.cancel_check && options.cancel_check()) {
        throw SourceUnavailableError("Transcription of " + location + " was cancelled");
    }

    std::string path = location.rfind("file://", 0) == 0 ? location.substr(7) : location;
    if (!fs::is_regular_file(path)) {
        throw SourceUnavailableError("No transcript file at " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw SourceUnavailableError("Cannot open transcript " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    std::string content = ss.str();

    Transcript transcript;
    if (fs::path(path).extension() == ".json") {
        try {
            transcript = parse_whisper_json(json::parse(content));
        } catch (const std::exception& e) {
            throw SourceUnavailableError("Transcript " + path + " is malformed: " + e.what());
        }
    } else {
        transcript.text = content;
    }

    if (trim(transcript.text).empty()) {
        throw SourceUnavailableError("Transcript " + path + " is empty");
    }

    verbose_log("TRANSCRIPT", "Read " + path + ": " + std::to_string(transcript.text.size()) +
                " chars, " + std::to_string(transcript.segments.size()) + " segments");
    return transcript;
}

} // namespace quarry::providers
