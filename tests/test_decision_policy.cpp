#include <catch2/catch.hpp>
#include "decision_policy.hpp"
#include "config.hpp"

using namespace quarry;

namespace {

constexpr int64_t NOW = 1700000000;
constexpr int64_t WINDOW = 30 * SECONDS_PER_DAY;

RegistryEntry entry_indexed(int64_t age_seconds, int64_t questions) {
    RegistryEntry entry;
    entry.subject_id = "ada_lovelace";
    entry.display_name = "Ada Lovelace";
    entry.last_indexed_at = NOW - age_seconds;
    entry.question_count = questions;
    entry.status = questions > 0 ? SubjectStatus::Indexed : SubjectStatus::Empty;
    return entry;
}

DecisionInput input_for(std::optional<RegistryEntry> entry, bool force = false) {
    DecisionInput input;
    input.subject = "Ada Lovelace";
    input.entry = std::move(entry);
    input.force = force;
    input.freshness_window_seconds = WINDOW;
    input.now = NOW;
    return input;
}

// Counts calls and always answers RETRIEVE with a changing reason.
class CountingScorer : public IDecisionScorer {
public:
    explicit CountingScorer(int& calls) : calls_(calls) {}

    Decision score(const DecisionInput&) override {
        ++calls_;
        return {Action::Retrieve, "call " + std::to_string(calls_)};
    }

private:
    int& calls_;
};

} // namespace

TEST_CASE("Rule table", "[decision]") {
    SECTION("Cold start ingests") {
        Decision d = decide(input_for(std::nullopt));
        REQUIRE(d.action == Action::Ingest);
        REQUIRE(d.reason.find("No prior data") != std::string::npos);
        REQUIRE(d.requires_ingestion());
    }

    SECTION("Zero questions ingests even when fresh") {
        Decision d = decide(input_for(entry_indexed(SECONDS_PER_DAY, 0)));
        REQUIRE(d.action == Action::Ingest);
        REQUIRE(d.reason.find("produced no questions") != std::string::npos);
    }

    SECTION("Force overrides freshness") {
        Decision d = decide(input_for(entry_indexed(SECONDS_PER_DAY, 12), true));
        REQUIRE(d.action == Action::Ingest);
        REQUIRE(d.reason == "Force ingest requested");
    }

    SECTION("Fresh index retrieves") {
        Decision d = decide(input_for(entry_indexed(SECONDS_PER_DAY, 12)));
        REQUIRE(d.action == Action::Retrieve);
        REQUIRE_FALSE(d.requires_ingestion());
        REQUIRE(d.reason == "Index is fresh (last indexed 1 day ago, freshness window 30 days) with 12 questions");
    }

    SECTION("Stale index ingests incrementally") {
        Decision d = decide(input_for(entry_indexed(45 * SECONDS_PER_DAY, 12)));
        REQUIRE(d.action == Action::IncrementalIngest);
        REQUIRE(d.reason.find("stale") != std::string::npos);
        REQUIRE(d.reason.find("45 days") != std::string::npos);
    }

    SECTION("Age equal to the window counts as stale") {
        Decision d = decide(input_for(entry_indexed(WINDOW, 3)));
        REQUIRE(d.action == Action::IncrementalIngest);
    }

    SECTION("Clock skew into the future counts as fresh") {
        Decision d = decide(input_for(entry_indexed(-600, 3)));
        REQUIRE(d.action == Action::Retrieve);
    }
}

TEST_CASE("Action names", "[decision]") {
    REQUIRE(to_string(Action::Ingest) == "INGEST");
    REQUIRE(to_string(Action::Retrieve) == "RETRIEVE");
    REQUIRE(to_string(Action::IncrementalIngest) == "INCREMENTAL_INGEST");
}

TEST_CASE("Policy is deterministic per input snapshot", "[decision]") {
    SECTION("Default scorer repeats itself") {
        DecisionPolicy policy;
        auto input = input_for(entry_indexed(2 * SECONDS_PER_DAY, 5));
        Decision first = policy.decide(input);
        Decision second = policy.decide(input);
        REQUIRE(first.action == second.action);
        REQUIRE(first.reason == second.reason);
    }

    SECTION("A custom scorer runs once per distinct snapshot") {
        int calls = 0;
        DecisionPolicy policy(std::make_unique<CountingScorer>(calls));

        auto input = input_for(entry_indexed(2 * SECONDS_PER_DAY, 5));
        Decision first = policy.decide(input);
        Decision second = policy.decide(input);
        REQUIRE(calls == 1);
        REQUIRE(first.reason == second.reason);

        // A new ingestion changes the snapshot
        input.entry->question_count = 9;
        Decision third = policy.decide(input);
        REQUIRE(calls == 2);
        REQUIRE(third.reason == "call 2");
    }
}
