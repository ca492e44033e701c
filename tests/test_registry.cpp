#include <catch2/catch.hpp>
#include "registry.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <fstream>

using namespace quarry;
using namespace quarry::testing;

static RegistryDelta delta_of(int64_t articles, int64_t questions, std::vector<std::string> sources) {
    RegistryDelta delta;
    delta.display_name = "Grace Hopper";
    delta.source_counts.article = articles;
    delta.question_count = questions;
    delta.sources = std::move(sources);
    return delta;
}

TEST_CASE("Subject keys", "[registry]") {
    REQUIRE(subject_key("Grace Hopper") == "grace_hopper");
    REQUIRE(subject_key("  grace HOPPER ") == "grace_hopper");
    REQUIRE(subject_key("AC/DC") == "ac_dc");
}

TEST_CASE("Upsert is additive", "[registry]") {
    TempDir dir;
    EntityRegistry registry(dir.file("registry.json"));
    registry.load();

    REQUIRE_FALSE(registry.get("Grace Hopper").has_value());

    RegistryEntry first = registry.upsert("Grace Hopper", delta_of(2, 10, {"https://a", "https://b"}), 1000);
    REQUIRE(first.subject_id == "grace_hopper");
    REQUIRE(first.display_name == "Grace Hopper");
    REQUIRE(first.question_count == 10);
    REQUIRE(first.source_counts.article == 2);
    REQUIRE(first.status == SubjectStatus::Indexed);

    RegistryEntry second = registry.upsert("grace hopper", delta_of(1, 4, {"https://b", "https://c"}), 2000);
    REQUIRE(second.question_count == 14);
    REQUIRE(second.source_counts.article == 3);
    REQUIRE(second.last_indexed_at == 2000);
    REQUIRE(second.display_name == "Grace Hopper");
    REQUIRE(second.sources == std::vector<std::string>{"https://a", "https://b", "https://c"});

    SECTION("Negative deltas never reduce counts") {
        RegistryEntry third = registry.upsert("Grace Hopper", delta_of(-5, -5, {}), 3000);
        REQUIRE(third.question_count == 14);
        REQUIRE(third.source_counts.article == 3);
    }

    SECTION("A degraded run marks the entry") {
        RegistryDelta degraded = delta_of(1, 1, {"https://d"});
        degraded.degraded = true;
        REQUIRE(registry.upsert("Grace Hopper", degraded, 3000).status == SubjectStatus::Degraded);
    }
}

TEST_CASE("A run with no questions leaves the subject empty", "[registry]") {
    TempDir dir;
    EntityRegistry registry(dir.file("registry.json"));
    RegistryEntry entry = registry.upsert("Nobody", delta_of(0, 0, {}), 500);
    REQUIRE(entry.status == SubjectStatus::Empty);
    REQUIRE(entry.last_indexed_at == 500);
}

TEST_CASE("Registry survives a reload", "[registry]") {
    TempDir dir;
    std::string path = dir.file("registry.json");
    {
        EntityRegistry registry(path);
        registry.upsert("Grace Hopper", delta_of(2, 10, {"https://a", "https://b"}), 1000);
        registry.upsert("Alan Turing", delta_of(1, 3, {"https://t"}), 1500);
        registry.flush();
    }

    EntityRegistry reloaded(path);
    reloaded.load();
    auto entry = reloaded.get("Grace Hopper");
    REQUIRE(entry.has_value());
    REQUIRE(entry->question_count == 10);
    REQUIRE(entry->last_indexed_at == 1000);
    REQUIRE(entry->sources.size() == 2);

    auto all = reloaded.list();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].subject_id == "alan_turing");
    REQUIRE(all[1].subject_id == "grace_hopper");
}

TEST_CASE("Corrupt registry entries block only their subject", "[registry]") {
    TempDir dir;
    std::string path = dir.file("registry.json");
    {
        std::ofstream out(path);
        out << R"({"version": 1, "subjects": {
            "broken": {"display_name": "Broken", "question_count": "many"},
            "fine": {"display_name": "Fine", "last_indexed_at": 100, "question_count": 2}
        }})";
    }

    EntityRegistry registry(path);
    registry.load();

    REQUIRE(registry.get("Fine")->question_count == 2);
    REQUIRE_THROWS_AS(registry.get("Broken"), RegistryCorruptError);
    REQUIRE_THROWS_AS(registry.upsert("Broken", delta_of(1, 1, {}), 200), RegistryCorruptError);
    REQUIRE(registry.corrupt_subjects() == std::vector<std::string>{"broken"});

    SECTION("Corrupt entries are written back until reset") {
        registry.flush();
        EntityRegistry again(path);
        again.load();
        REQUIRE_THROWS_AS(again.get("Broken"), RegistryCorruptError);
    }

    SECTION("Reset clears the corruption") {
        REQUIRE(registry.reset("Broken"));
        REQUIRE_FALSE(registry.get("Broken").has_value());
        REQUIRE(registry.corrupt_subjects().empty());
    }
}

TEST_CASE("Unreadable registry file", "[registry]") {
    TempDir dir;
    std::string path = dir.file("registry.json");
    {
        std::ofstream out(path);
        out << "this is not json";
    }
    EntityRegistry registry(path);
    REQUIRE_THROWS_AS(registry.load(), RegistryCorruptError);
}
