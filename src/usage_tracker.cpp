#include "usage_tracker.hpp"
#include "verbose.hpp"
#include <sstream>

namespace quarry {

void UsageTracker::record(const std::string& model,
                          const std::string& purpose,
                          int input_tokens,
                          int output_tokens) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        totals_.calls += 1;
        totals_.input_tokens += input_tokens;
        totals_.output_tokens += output_tokens;

        UsageTotals& bucket = by_purpose_[purpose];
        bucket.calls += 1;
        bucket.input_tokens += input_tokens;
        bucket.output_tokens += output_tokens;
    }

    verbose_log("USAGE", purpose + " via " + model + ": " + std::to_string(input_tokens) +
                " in / " + std::to_string(output_tokens) + " out");
}

UsageTotals UsageTracker::totals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totals_;
}

std::map<std::string, UsageTotals> UsageTracker::by_purpose() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_purpose_;
}

std::string UsageTracker::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    for (const auto& [purpose, bucket] : by_purpose_) {
        out << purpose << ": " << bucket.calls << (bucket.calls == 1 ? " call, " : " calls, ")
            << bucket.input_tokens << " in / " << bucket.output_tokens << " out\n";
    }
    return out.str();
}

} // namespace quarry
