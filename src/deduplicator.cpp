#include "deduplicator.hpp"
#include <stdexcept>

namespace quarry {

float dot(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("dot: vectors differ in dimension");
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return static_cast<float>(sum);
}

std::vector<std::vector<size_t>> group_near_duplicates(
    const std::vector<std::vector<float>>& vectors, float threshold) {
    std::vector<std::vector<size_t>> groups;
    std::vector<bool> assigned(vectors.size(), false);

    for (size_t i = 0; i < vectors.size(); ++i) {
        if (assigned[i]) {
            continue;
        }
        assigned[i] = true;
        std::vector<size_t> group{i};

        for (size_t j = i + 1; j < vectors.size(); ++j) {
            if (!assigned[j] && dot(vectors[i], vectors[j]) >= threshold) {
                assigned[j] = true;
                group.push_back(j);
            }
        }
        groups.push_back(std::move(group));
    }
    return groups;
}

} // namespace quarry
