#include "question_record.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace quarry {

using json = nlohmann::json;

std::string to_string(SourceType type) {
    switch (type) {
        case SourceType::Video:
            return "video";
        case SourceType::Audio:
            return "audio";
        case SourceType::Article:
            return "article";
    }
    return "article";
}

std::optional<SourceType> parse_source_type(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    // Accept the media names used by the original ingesters as aliases.
    if (lower == "video" || lower == "youtube") {
        return SourceType::Video;
    }
    if (lower == "audio" || lower == "podcast") {
        return SourceType::Audio;
    }
    if (lower == "article" || lower == "text") {
        return SourceType::Article;
    }
    return std::nullopt;
}

std::string subject_key(const std::string& name) {
    size_t start = name.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = name.find_last_not_of(" \t\n\r");

    std::string key;
    key.reserve(end - start + 1);
    for (size_t i = start; i <= end; ++i) {
        char c = name[i];
        if (c == ' ' || c == '/' || c == '\\' || c == '\t') {
            key += '_';
        } else {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return key;
}

json source_to_json(const SourceRef& source) {
    json j = {
        {"source_type", to_string(source.type)},
        {"source_url", source.url},
        {"source_title", source.title}
    };
    if (source.media_timestamp) {
        j["media_timestamp"] = *source.media_timestamp;
    } else {
        j["media_timestamp"] = nullptr;
    }
    if (!source.published.empty()) {
        j["published"] = source.published;
    }
    return j;
}

SourceRef source_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("source entry is not an object");
    }

    SourceRef source;
    auto type = parse_source_type(j.value("source_type", ""));
    if (!type) {
        throw std::invalid_argument("unknown source_type '" + j.value("source_type", "") + "'");
    }
    source.type = *type;
    source.url = j.value("source_url", "");
    source.title = j.value("source_title", "");
    source.published = j.value("published", "");

    if (j.contains("media_timestamp") && j["media_timestamp"].is_number()) {
        source.media_timestamp = j["media_timestamp"].get<double>();
    }
    return source;
}

json record_to_json(const QuestionRecord& record) {
    json sources = json::array();
    for (const auto& source : record.sources) {
        sources.push_back(source_to_json(source));
    }

    return {
        {"id", record.id},
        {"subject_id", record.subject_id},
        {"text", record.text},
        {"sources", sources},
        {"captured_at", record.captured_at}
    };
}

QuestionRecord record_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("record is not an object");
    }
    if (!j.contains("id") || !j["id"].is_number_unsigned()) {
        throw std::invalid_argument("record has no numeric id");
    }
    if (!j.contains("text") || !j["text"].is_string()) {
        throw std::invalid_argument("record has no text");
    }
    if (!j.contains("sources") || !j["sources"].is_array() || j["sources"].empty()) {
        throw std::invalid_argument("record has no sources");
    }

    QuestionRecord record;
    record.id = j["id"].get<uint64_t>();
    record.subject_id = j.value("subject_id", "");
    record.text = j["text"].get<std::string>();
    record.captured_at = j.value("captured_at", int64_t(0));

    for (const auto& source_json : j["sources"]) {
        record.sources.push_back(source_from_json(source_json));
    }
    return record;
}

} // namespace quarry
