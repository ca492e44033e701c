#include <catch2/catch.hpp>
#include "settings.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <fstream>

using namespace quarry;
using namespace quarry::testing;

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

TEST_CASE("Missing settings file", "[settings]") {
    TempDir dir;
    REQUIRE_FALSE(load_settings(dir.file(".quarry.json")).has_value());
}

TEST_CASE("Settings file overrides defaults", "[settings]") {
    TempDir dir;
    std::string path = dir.file(".quarry.json");
    write_file(path, R"({
        "data_dir": "/var/lib/quarry",
        "similarity_threshold": 0.8,
        "freshness_days": 7,
        "deduplicate": true,
        "embedding": {"provider": "openai", "dimension": 1536},
        "subjects": {
            "Serena Williams": [
                {"type": "video", "url": "https://video.example/1", "title": "Late Show",
                 "transcript": "transcripts/late_show.json"},
                {"type": "article", "url": "https://news.example/serena"}
            ]
        }
    })");

    auto settings = load_settings(path);
    REQUIRE(settings.has_value());
    REQUIRE(settings->data_dir == "/var/lib/quarry");
    REQUIRE(settings->similarity_threshold == Approx(0.8f));
    REQUIRE(settings->freshness_window_seconds() == 7 * SECONDS_PER_DAY);
    REQUIRE(settings->deduplicate);
    REQUIRE(settings->top_k == DEFAULT_TOP_K);
    REQUIRE(settings->embedding.provider == "openai");
    REQUIRE(settings->embedding.dimension == 1536);
    REQUIRE(settings->embedding.model == DEFAULT_EMBEDDING_MODEL);

    const auto* sources = find_subject_sources(*settings, "serena williams");
    REQUIRE(sources != nullptr);
    REQUIRE(sources->size() == 2);
    REQUIRE(source_type((*sources)[0]) == SourceType::Video);
    REQUIRE(std::get<VideoSource>((*sources)[0]).transcript == "transcripts/late_show.json");
    // Title defaults to the URL
    REQUIRE(source_ref((*sources)[1]).title == "https://news.example/serena");

    REQUIRE(find_subject_sources(*settings, "Venus Williams") == nullptr);
}

TEST_CASE("Settings round-trip through save", "[settings]") {
    TempDir dir;
    std::string path = dir.file("nested/.quarry.json");

    Settings settings;
    settings.top_k = 9;
    settings.refine = true;
    settings.subjects["Ada"] = {make_source(SourceType::Audio, "https://pod.example/ep1", "Episode 1")};
    save_settings(settings, path);

    auto loaded = load_settings(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->top_k == 9);
    REQUIRE(loaded->refine);
    REQUIRE(loaded->subjects.at("Ada").size() == 1);
    REQUIRE(source_url(loaded->subjects.at("Ada")[0]) == "https://pod.example/ep1");
}

TEST_CASE("Malformed settings are config errors", "[settings]") {
    TempDir dir;
    std::string path = dir.file(".quarry.json");

    SECTION("Not JSON") {
        write_file(path, "{ data_dir: ");
        REQUIRE_THROWS_AS(load_settings(path), ConfigError);
    }

    SECTION("Wrong value type") {
        write_file(path, R"({"top_k": "five"})");
        REQUIRE_THROWS_AS(load_settings(path), ConfigError);
    }

    SECTION("Unknown source type") {
        write_file(path, R"({"subjects": {"A": [{"type": "fax", "url": "x"}]}})");
        REQUIRE_THROWS_AS(load_settings(path), ConfigError);
    }

    SECTION("Inverted token window") {
        write_file(path, R"({"min_tokens": 10, "max_tokens": 3})");
        REQUIRE_THROWS_AS(load_settings(path), ConfigError);
    }

    SECTION("Zero embedding dimension") {
        write_file(path, R"({"embedding": {"dimension": 0}})");
        REQUIRE_THROWS_AS(load_settings(path), ConfigError);
    }
}
