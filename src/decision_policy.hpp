#pragma once

/**
 * Decides whether a request needs new data before retrieval.
 *
 * The decision is a pure function of the registry entry, the force flag,
 * the freshness window and the current time. A custom scorer can replace
 * the rule table, but its verdicts are cached per input snapshot so the
 * same inputs always produce the same action and reason.
 */

#include "registry.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace quarry {

enum class Action {
    Ingest,             // Index all configured sources.
    Retrieve,           // Existing data is fresh; search only.
    IncrementalIngest   // Fetch only sources not yet ingested, then search.
};

// Returns "INGEST", "RETRIEVE" or "INCREMENTAL_INGEST".
std::string to_string(Action action);

/**
 * A decision plus the reasoning behind it.
 */
struct Decision {
    Action action = Action::Ingest;
    std::string reason;

    bool requires_ingestion() const { return action != Action::Retrieve; }
};

/**
 * Everything a decision may depend on.
 */
struct DecisionInput {
    std::string subject;
    std::optional<RegistryEntry> entry;
    bool force = false;
    int64_t freshness_window_seconds = 0;
    int64_t now = 0;
};

/**
 * Applies the rule table:
 *   no entry, or an entry with zero questions -> INGEST
 *   force                                      -> INGEST
 *   age <  freshness window                    -> RETRIEVE
 *   age >= freshness window                    -> INCREMENTAL_INGEST
 */
Decision decide(const DecisionInput& input);

/**
 * Interface for pluggable decision scorers.
 */
class IDecisionScorer {
public:
    virtual ~IDecisionScorer() = default;
    virtual Decision score(const DecisionInput& input) = 0;
};

/**
 * The default scorer; forwards to decide().
 */
class RuleTableScorer : public IDecisionScorer {
public:
    Decision score(const DecisionInput& input) override { return decide(input); }
};

/**
 * Runs a scorer and memoizes its verdict for each distinct input.
 */
class DecisionPolicy {
public:
    // Uses RuleTableScorer when scorer is null.
    explicit DecisionPolicy(std::unique_ptr<IDecisionScorer> scorer = nullptr);

    Decision decide(const DecisionInput& input);

private:
    std::unique_ptr<IDecisionScorer> scorer_;
    std::mutex mutex_;
    std::map<std::string, Decision> cache_;
};

} // namespace quarry
