#pragma once

/**
 * Interview sources as a closed set of variants.
 *
 * Every source kind knows how to produce raw text plus provenance, using
 * the fetch and transcription collaborators. The ingestion run treats
 * sources uniformly through SourceReader.
 */

#include "question_record.hpp"
#include "providers/provider.hpp"
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace quarry {

/**
 * A video interview. transcript optionally points to a prepared transcript
 * file; otherwise url is handed to the transcriber.
 */
struct VideoSource {
    std::string url;
    std::string title;
    std::string transcript;
    std::string published;
};

/**
 * A podcast episode or other audio interview.
 */
struct AudioSource {
    std::string url;
    std::string title;
    std::string transcript;
    std::string published;
};

/**
 * A written interview fetched as text.
 */
struct ArticleSource {
    std::string url;
    std::string title;
    std::string published;
};

using Source = std::variant<VideoSource, AudioSource, ArticleSource>;

// Builds a source of the given kind. title defaults to url when empty.
Source make_source(SourceType type,
                   const std::string& url,
                   const std::string& title = "",
                   const std::string& transcript = "",
                   const std::string& published = "");

SourceType source_type(const Source& source);

// Returns the URL identifying the source; used to skip known sources.
std::string source_url(const Source& source);

// Provenance for questions mined from this source (no media timestamp).
SourceRef source_ref(const Source& source);

// Serializes a source the way it is written in the settings file.
nlohmann::json source_spec_to_json(const Source& source);

// Parses a settings-file source entry. Throws ConfigError if malformed.
Source source_spec_from_json(const nlohmann::json& j);

/**
 * Raw text produced by a source, with its provenance.
 * segments is non-empty for timestamped transcripts.
 */
struct SourceText {
    SourceRef source;
    std::string text;
    std::vector<providers::TranscriptSegment> segments;
};

/**
 * Returns text with every byte sequence that is not well-formed UTF-8
 * (stray Latin-1 bytes, overlong forms, surrogates, truncated sequences)
 * replaced by U+FFFD.
 */
std::string sanitize_utf8(const std::string& text);

/**
 * Reads sources through the fetch and transcription collaborators.
 */
class SourceReader {
public:
    SourceReader(providers::IFetcher& fetcher, providers::ITranscriber& transcriber);

    /**
     * Produces text for a source. Any collaborator failure is reported as
     * SourceUnavailableError so the caller can skip just this source.
     * Returned text is always valid UTF-8.
     */
    SourceText read(const Source& source, const providers::FetchOptions& options);

private:
    providers::IFetcher& fetcher_;
    providers::ITranscriber& transcriber_;
};

} // namespace quarry
