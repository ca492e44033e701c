#include "settings.hpp"
#include "atomic_file.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>

namespace quarry {

using json = nlohmann::json;

std::optional<Settings> load_settings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open settings file " + path);
    }

    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            throw ConfigError("Settings file " + path + " must hold a JSON object");
        }

        Settings settings;
        settings.data_dir = j.value("data_dir", settings.data_dir);
        settings.similarity_threshold = j.value("similarity_threshold", settings.similarity_threshold);
        settings.over_fetch_factor = j.value("over_fetch_factor", settings.over_fetch_factor);
        settings.top_k = j.value("top_k", settings.top_k);
        settings.freshness_days = j.value("freshness_days", settings.freshness_days);
        settings.refine = j.value("refine", settings.refine);
        settings.refine_batch_size = j.value("refine_batch_size", settings.refine_batch_size);
        settings.min_tokens = j.value("min_tokens", settings.min_tokens);
        settings.max_tokens = j.value("max_tokens", settings.max_tokens);
        settings.deduplicate = j.value("deduplicate", settings.deduplicate);
        settings.dedup_threshold = j.value("dedup_threshold", settings.dedup_threshold);
        settings.source_timeout_seconds = j.value("source_timeout_seconds", settings.source_timeout_seconds);

        if (j.contains("embedding") && j["embedding"].is_object()) {
            const json& e = j["embedding"];
            settings.embedding.provider = e.value("provider", settings.embedding.provider);
            settings.embedding.model = e.value("model", settings.embedding.model);
            settings.embedding.base_url = e.value("base_url", settings.embedding.base_url);
            settings.embedding.dimension = e.value("dimension", settings.embedding.dimension);
        }

        if (j.contains("refiner") && j["refiner"].is_object()) {
            const json& r = j["refiner"];
            settings.refiner.model = r.value("model", settings.refiner.model);
            settings.refiner.base_url = r.value("base_url", settings.refiner.base_url);
        }

        if (j.contains("subjects")) {
            if (!j["subjects"].is_object()) {
                throw ConfigError("'subjects' must map subject names to source lists");
            }
            for (const auto& [name, list] : j["subjects"].items()) {
                if (!list.is_array()) {
                    throw ConfigError("Sources for '" + name + "' must be an array");
                }
                std::vector<Source> sources;
                for (const auto& spec : list) {
                    sources.push_back(source_spec_from_json(spec));
                }
                settings.subjects[name] = std::move(sources);
            }
        }

        if (settings.min_tokens > settings.max_tokens) {
            throw ConfigError("min_tokens must not exceed max_tokens");
        }
        if (settings.embedding.dimension == 0) {
            throw ConfigError("embedding.dimension must be positive");
        }

        return settings;
    } catch (const json::exception& e) {
        throw ConfigError("Settings file " + path + " is malformed: " + e.what());
    }
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["data_dir"] = settings.data_dir;
    j["similarity_threshold"] = settings.similarity_threshold;
    j["over_fetch_factor"] = settings.over_fetch_factor;
    j["top_k"] = settings.top_k;
    j["freshness_days"] = settings.freshness_days;
    j["refine"] = settings.refine;
    j["refine_batch_size"] = settings.refine_batch_size;
    j["min_tokens"] = settings.min_tokens;
    j["max_tokens"] = settings.max_tokens;
    j["deduplicate"] = settings.deduplicate;
    j["dedup_threshold"] = settings.dedup_threshold;
    j["source_timeout_seconds"] = settings.source_timeout_seconds;

    j["embedding"] = {
        {"provider", settings.embedding.provider},
        {"model", settings.embedding.model},
        {"base_url", settings.embedding.base_url},
        {"dimension", settings.embedding.dimension}
    };
    j["refiner"] = {
        {"model", settings.refiner.model},
        {"base_url", settings.refiner.base_url}
    };

    json subjects_json = json::object();
    for (const auto& [name, sources] : settings.subjects) {
        json list = json::array();
        for (const auto& source : sources) {
            list.push_back(source_spec_to_json(source));
        }
        subjects_json[name] = list;
    }
    j["subjects"] = subjects_json;

    write_file_atomically(path, [&](std::ostream& out) {
        out << j.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    });
}

const std::vector<Source>* find_subject_sources(const Settings& settings, const std::string& subject) {
    std::string key = subject_key(subject);
    for (const auto& [name, sources] : settings.subjects) {
        if (subject_key(name) == key) {
            return &sources;
        }
    }
    return nullptr;
}

} // namespace quarry
