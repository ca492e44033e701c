#include "decision_policy.hpp"
#include "config.hpp"
#include "verbose.hpp"

namespace quarry {

constexpr size_t MAX_CACHED_DECISIONS = 4096;

std::string to_string(Action action) {
    switch (action) {
        case Action::Ingest:
            return "INGEST";
        case Action::Retrieve:
            return "RETRIEVE";
        case Action::IncrementalIngest:
            return "INCREMENTAL_INGEST";
    }
    return "INGEST";
}

static std::string plural_days(int64_t days) {
    return std::to_string(days) + (days == 1 ? " day" : " days");
}

Decision decide(const DecisionInput& input) {
    if (!input.entry) {
        return {Action::Ingest,
                "No prior data for '" + input.subject + "': subject has never been indexed"};
    }

    const RegistryEntry& entry = *input.entry;
    if (entry.question_count == 0) {
        return {Action::Ingest,
                "Previous ingestion for '" + input.subject + "' produced no questions"};
    }

    if (input.force) {
        return {Action::Ingest, "Force ingest requested"};
    }

    int64_t age = input.now - entry.last_indexed_at;
    int64_t age_days = age > 0 ? age / SECONDS_PER_DAY : 0;
    int64_t window_days = input.freshness_window_seconds / SECONDS_PER_DAY;
    std::string timing = "last indexed " + plural_days(age_days) + " ago, freshness window " +
                         plural_days(window_days);

    if (age < input.freshness_window_seconds) {
        return {Action::Retrieve,
                "Index is fresh (" + timing + ") with " +
                std::to_string(entry.question_count) + " questions"};
    }

    return {Action::IncrementalIngest,
            "Index is stale (" + timing + "); fetching new sources"};
}

DecisionPolicy::DecisionPolicy(std::unique_ptr<IDecisionScorer> scorer)
    : scorer_(scorer ? std::move(scorer) : std::make_unique<RuleTableScorer>()) {}

// Identifies an input snapshot; two equal keys must yield the same decision.
static std::string snapshot_key(const DecisionInput& input) {
    std::string key = input.subject + "|" + (input.force ? "1" : "0") + "|" +
                      std::to_string(input.freshness_window_seconds) + "|" +
                      std::to_string(input.now) + "|";
    if (input.entry) {
        key += std::to_string(input.entry->last_indexed_at) + "|" +
               std::to_string(input.entry->question_count);
    } else {
        key += "absent";
    }
    return key;
}

Decision DecisionPolicy::decide(const DecisionInput& input) {
    std::string key = snapshot_key(input);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }

    Decision decision = scorer_->score(input);
    verbose_log("DECISION", input.subject + ": " + to_string(decision.action) + " - " + decision.reason);
    if (cache_.size() >= MAX_CACHED_DECISIONS) {
        cache_.clear();
    }
    cache_.emplace(key, decision);
    return decision;
}

} // namespace quarry
