#pragma once

/**
 * Near-duplicate grouping of question embeddings.
 */

#include <cstddef>
#include <vector>

namespace quarry {

/**
 * Groups unit vectors whose cosine similarity to a group's first member is
 * at least threshold. Groups are formed greedily in input order, so each
 * group is led by its earliest member and every input index appears in
 * exactly one group.
 */
std::vector<std::vector<size_t>> group_near_duplicates(
    const std::vector<std::vector<float>>& vectors, float threshold);

// Dot product of two equal-length vectors.
float dot(const std::vector<float>& a, const std::vector<float>& b);

} // namespace quarry
