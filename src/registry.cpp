#include "registry.hpp"
#include "atomic_file.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace quarry {

using json = nlohmann::json;

constexpr int REGISTRY_VERSION = 1;

void SourceCounts::add(SourceType type, int64_t n) {
    switch (type) {
        case SourceType::Video:
            video += n;
            break;
        case SourceType::Audio:
            audio += n;
            break;
        case SourceType::Article:
            article += n;
            break;
    }
}

int64_t SourceCounts::get(SourceType type) const {
    switch (type) {
        case SourceType::Video:
            return video;
        case SourceType::Audio:
            return audio;
        case SourceType::Article:
            return article;
    }
    return 0;
}

std::string to_string(SubjectStatus status) {
    switch (status) {
        case SubjectStatus::Indexed:
            return "indexed";
        case SubjectStatus::Empty:
            return "empty";
        case SubjectStatus::Degraded:
            return "degraded";
    }
    return "empty";
}

static SubjectStatus parse_status(const std::string& name) {
    if (name == "indexed") return SubjectStatus::Indexed;
    if (name == "empty") return SubjectStatus::Empty;
    if (name == "degraded") return SubjectStatus::Degraded;
    throw std::invalid_argument("unknown status '" + name + "'");
}

json entry_to_json(const RegistryEntry& entry) {
    return {
        {"display_name", entry.display_name},
        {"last_indexed_at", entry.last_indexed_at},
        {"source_counts", {
            {"video", entry.source_counts.video},
            {"audio", entry.source_counts.audio},
            {"article", entry.source_counts.article}
        }},
        {"question_count", entry.question_count},
        {"status", to_string(entry.status)},
        {"sources", entry.sources}
    };
}

RegistryEntry entry_from_json(const std::string& key, const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("entry is not an object");
    }
    if (!j.contains("last_indexed_at") || !j["last_indexed_at"].is_number_integer()) {
        throw std::invalid_argument("missing last_indexed_at");
    }
    if (!j.contains("question_count") || !j["question_count"].is_number_integer()) {
        throw std::invalid_argument("missing question_count");
    }

    RegistryEntry entry;
    entry.subject_id = key;
    entry.display_name = j.value("display_name", key);
    entry.last_indexed_at = j["last_indexed_at"].get<int64_t>();
    entry.question_count = j["question_count"].get<int64_t>();
    if (entry.question_count < 0) {
        throw std::invalid_argument("negative question_count");
    }
    entry.status = parse_status(j.value("status", "indexed"));

    if (j.contains("source_counts")) {
        const auto& counts = j["source_counts"];
        if (!counts.is_object()) {
            throw std::invalid_argument("source_counts is not an object");
        }
        entry.source_counts.video = counts.value("video", int64_t(0));
        entry.source_counts.audio = counts.value("audio", int64_t(0));
        entry.source_counts.article = counts.value("article", int64_t(0));
    }

    if (j.contains("sources")) {
        if (!j["sources"].is_array()) {
            throw std::invalid_argument("sources is not an array");
        }
        for (const auto& url : j["sources"]) {
            if (url.is_string()) {
                entry.sources.push_back(url.get<std::string>());
            }
        }
    }
    return entry;
}

EntityRegistry::EntityRegistry(std::string path) : path_(std::move(path)) {}

void EntityRegistry::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    corrupt_.clear();

    if (!std::filesystem::exists(path_)) {
        verbose_log("REGISTRY", "No registry at " + path_ + ", starting empty");
        return;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw RegistryCorruptError("*", "cannot open " + path_);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw RegistryCorruptError("*", std::string("not valid JSON: ") + e.what());
    }

    if (!j.is_object() || !j.contains("subjects") || !j["subjects"].is_object()) {
        throw RegistryCorruptError("*", "missing 'subjects' object");
    }

    for (const auto& [key, entry_json] : j["subjects"].items()) {
        try {
            entries_[key] = entry_from_json(key, entry_json);
        } catch (const std::exception& e) {
            warn_log("REGISTRY", "Entry '" + key + "' is corrupt: " + e.what());
            corrupt_[key] = entry_json;
        }
    }

    verbose_log("REGISTRY", "Loaded " + std::to_string(entries_.size()) + " subject(s) from " + path_);
}

std::optional<RegistryEntry> EntityRegistry::get(const std::string& subject) const {
    std::string key = subject_key(subject);
    std::lock_guard<std::mutex> lock(mutex_);

    if (corrupt_.count(key) > 0) {
        throw RegistryCorruptError(key, "entry could not be parsed; reset the subject");
    }

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

RegistryEntry EntityRegistry::upsert(const std::string& subject, const RegistryDelta& delta, int64_t now) {
    std::string key = subject_key(subject);
    std::lock_guard<std::mutex> lock(mutex_);

    if (corrupt_.count(key) > 0) {
        throw RegistryCorruptError(key, "entry could not be parsed; reset the subject");
    }

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        RegistryEntry fresh;
        fresh.subject_id = key;
        fresh.display_name = delta.display_name.empty() ? subject : delta.display_name;
        it = entries_.emplace(key, fresh).first;
    }

    RegistryEntry& entry = it->second;
    entry.source_counts.video += std::max<int64_t>(0, delta.source_counts.video);
    entry.source_counts.audio += std::max<int64_t>(0, delta.source_counts.audio);
    entry.source_counts.article += std::max<int64_t>(0, delta.source_counts.article);
    entry.question_count += std::max<int64_t>(0, delta.question_count);
    entry.last_indexed_at = now;

    for (const auto& url : delta.sources) {
        if (std::find(entry.sources.begin(), entry.sources.end(), url) == entry.sources.end()) {
            entry.sources.push_back(url);
        }
    }

    if (entry.question_count == 0) {
        entry.status = SubjectStatus::Empty;
    } else if (delta.degraded) {
        entry.status = SubjectStatus::Degraded;
    } else {
        entry.status = SubjectStatus::Indexed;
    }

    verbose_log("REGISTRY", "Upserted '" + key + "': " + std::to_string(entry.question_count) +
                " questions, " + std::to_string(entry.source_counts.total()) + " sources");
    return entry;
}

bool EntityRegistry::reset(const std::string& subject) {
    std::string key = subject_key(subject);
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = entries_.erase(key) > 0;
    removed = corrupt_.erase(key) > 0 || removed;
    return removed;
}

std::vector<RegistryEntry> EntityRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RegistryEntry> out;
    out.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        out.push_back(entry);
    }
    return out;
}

std::vector<std::string> EntityRegistry::corrupt_subjects() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [key, raw] : corrupt_) {
        out.push_back(key);
    }
    return out;
}

void EntityRegistry::flush() const {
    // Held across the write so concurrent flushes don't share the temp file
    std::lock_guard<std::mutex> lock(mutex_);

    json subjects = json::object();
    for (const auto& [key, entry] : entries_) {
        subjects[key] = entry_to_json(entry);
    }
    for (const auto& [key, raw] : corrupt_) {
        subjects[key] = raw;
    }

    json j = {
        {"version", REGISTRY_VERSION},
        {"subjects", subjects}
    };

    write_file_atomically(path_, [&j](std::ostream& out) {
        out << j.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    });
    verbose_log("REGISTRY", "Flushed registry to " + path_);
}

} // namespace quarry
