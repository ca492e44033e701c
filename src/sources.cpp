#include "sources.hpp"
#include "errors.hpp"
#include "verbose.hpp"

namespace quarry {

using json = nlohmann::json;

namespace {

// Produces text for each source kind.
struct ReadVisitor {
    providers::IFetcher& fetcher;
    providers::ITranscriber& transcriber;
    const providers::FetchOptions& options;

    SourceText from_media(const SourceRef& ref, const std::string& url, const std::string& transcript) {
        const std::string& location = transcript.empty() ? url : transcript;
        providers::Transcript result = transcriber.transcribe(location, options);

        SourceText out;
        out.source = ref;
        out.text = std::move(result.text);
        out.segments = std::move(result.segments);
        return out;
    }

    SourceText operator()(const VideoSource& video) {
        return from_media(source_ref(video), video.url, video.transcript);
    }

    SourceText operator()(const AudioSource& audio) {
        return from_media(source_ref(audio), audio.url, audio.transcript);
    }

    SourceText operator()(const ArticleSource& article) {
        SourceText out;
        out.source = source_ref(article);
        out.text = fetcher.fetch(article.url, options);
        return out;
    }
};

} // namespace

Source make_source(SourceType type,
                   const std::string& url,
                   const std::string& title,
                   const std::string& transcript,
                   const std::string& published) {
    std::string display_title = title.empty() ? url : title;
    switch (type) {
        case SourceType::Video:
            return VideoSource{url, display_title, transcript, published};
        case SourceType::Audio:
            return AudioSource{url, display_title, transcript, published};
        case SourceType::Article:
            return ArticleSource{url, display_title, published};
    }
    return ArticleSource{url, display_title, published};
}

SourceType source_type(const Source& source) {
    if (std::holds_alternative<VideoSource>(source)) {
        return SourceType::Video;
    }
    if (std::holds_alternative<AudioSource>(source)) {
        return SourceType::Audio;
    }
    return SourceType::Article;
}

std::string source_url(const Source& source) {
    return std::visit([](const auto& s) { return s.url; }, source);
}

SourceRef source_ref(const Source& source) {
    SourceRef ref;
    ref.type = source_type(source);
    std::visit([&ref](const auto& s) {
        ref.url = s.url;
        ref.title = s.title;
        ref.published = s.published;
    }, source);
    return ref;
}

json source_spec_to_json(const Source& source) {
    json j = {
        {"type", to_string(source_type(source))},
        {"url", source_url(source)}
    };
    std::visit([&j](const auto& s) {
        j["title"] = s.title;
        if (!s.published.empty()) {
            j["published"] = s.published;
        }
    }, source);

    if (const auto* video = std::get_if<VideoSource>(&source)) {
        if (!video->transcript.empty()) {
            j["transcript"] = video->transcript;
        }
    } else if (const auto* audio = std::get_if<AudioSource>(&source)) {
        if (!audio->transcript.empty()) {
            j["transcript"] = audio->transcript;
        }
    }
    return j;
}

Source source_spec_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("source entry must be an object");
    }

    std::string type_name = j.value("type", "");
    auto type = parse_source_type(type_name);
    if (!type) {
        throw ConfigError("unknown source type '" + type_name + "'");
    }

    std::string url = j.value("url", "");
    std::string transcript = j.value("transcript", "");
    if (url.empty() && transcript.empty()) {
        throw ConfigError("source entry needs a url or transcript");
    }
    if (url.empty()) {
        url = transcript;
    }

    return make_source(*type, url, j.value("title", ""), transcript, j.value("published", ""));
}

std::string sanitize_utf8(const std::string& text) {
    static const std::string REPLACEMENT = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        unsigned char min_next = 0x80;
        unsigned char max_next = 0xBF;

        if (lead < 0x80) {
            out += text[i++];
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) min_next = 0xA0;  // overlong
            if (lead == 0xED) max_next = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) min_next = 0x90;  // overlong
            if (lead == 0xF4) max_next = 0x8F;  // above U+10FFFF
        }

        size_t valid = length == 0 ? 0 : 1;
        while (valid > 0 && valid < length && i + valid < text.size()) {
            unsigned char next = static_cast<unsigned char>(text[i + valid]);
            unsigned char low = valid == 1 ? min_next : 0x80;
            unsigned char high = valid == 1 ? max_next : 0xBF;
            if (next < low || next > high) {
                break;
            }
            ++valid;
        }

        if (length > 0 && valid == length) {
            out.append(text, i, length);
            i += length;
        } else {
            // One replacement per maximal invalid prefix
            out += REPLACEMENT;
            i += valid == 0 ? 1 : valid;
        }
    }
    return out;
}

SourceReader::SourceReader(providers::IFetcher& fetcher, providers::ITranscriber& transcriber)
    : fetcher_(fetcher), transcriber_(transcriber) {}

SourceText SourceReader::read(const Source& source, const providers::FetchOptions& options) {
    std::string url = source_url(source);
    verbose_log("SOURCE", "Reading " + to_string(source_type(source)) + " " + url);

    if (options.cancel_check && options.cancel_check()) {
        throw SourceUnavailableError(url + ": cancelled");
    }

    try {
        ReadVisitor visitor{fetcher_, transcriber_, options};
        SourceText text = std::visit(visitor, source);
        text.text = sanitize_utf8(text.text);
        for (auto& segment : text.segments) {
            segment.text = sanitize_utf8(segment.text);
        }
        verbose_log("SOURCE", "Read " + std::to_string(text.text.size()) + " bytes from " + url);
        return text;
    } catch (const SourceUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceUnavailableError(url + ": " + e.what());
    }
}

} // namespace quarry
