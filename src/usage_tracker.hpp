#pragma once

/**
 * Token accounting for metered collaborator calls.
 *
 * Refinement calls report their input and output token counts here so a
 * run can print what it consumed, broken down by purpose.
 */

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace quarry {

/**
 * Accumulated usage for one purpose.
 */
struct UsageTotals {
    int64_t calls = 0;
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
};

/**
 * Thread-safe usage sink.
 */
class UsageTracker {
public:
    // Records one call.
    void record(const std::string& model,
                const std::string& purpose,
                int input_tokens,
                int output_tokens);

    UsageTotals totals() const;

    std::map<std::string, UsageTotals> by_purpose() const;

    // One line per purpose, e.g. "refinement: 3 calls, 1200 in / 300 out".
    // Empty when nothing was recorded.
    std::string summary() const;

private:
    mutable std::mutex mutex_;
    UsageTotals totals_;
    std::map<std::string, UsageTotals> by_purpose_;
};

} // namespace quarry
