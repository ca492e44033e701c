#pragma once

/**
 * Exact inner-product vector store for one subject.
 *
 * Holds unit-length vectors keyed by the id they share with the metadata
 * store. Search is exhaustive, so rankings are exact; scores are cosine
 * similarities clamped to [-1, 1].
 */

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace quarry {

/**
 * A search hit: record id and its cosine similarity to the query.
 */
struct ScoredId {
    uint64_t id;
    float score;
};

class FlatVectorStore {
public:
    explicit FlatVectorStore(size_t dimension);

    /**
     * Appends a vector. Throws IndexWriteError if the id is already
     * present, the dimension is wrong, or the vector is not unit-length.
     */
    void insert(uint64_t id, const std::vector<float>& vector);

    // Removes a vector; used only to roll back a failed dual-write.
    bool remove(uint64_t id);

    /**
     * Returns up to over_k hits sorted by descending score; equal scores
     * are ordered by ascending id. Throws std::invalid_argument if the
     * query dimension is wrong.
     */
    std::vector<ScoredId> search(const std::vector<float>& query, size_t over_k) const;

    bool contains(uint64_t id) const { return slots_.count(id) > 0; }
    size_t count() const { return ids_.size(); }
    size_t dimension() const { return dimension_; }
    std::vector<uint64_t> ids() const { return ids_; }

    /**
     * Writes the store to path (binary, atomic replace). next_id is stored
     * alongside so the id counter survives even if metadata is lost.
     */
    void save(const std::string& path, uint64_t next_id) const;

    /**
     * Reads a store written by save(). Throws std::runtime_error on a
     * malformed or truncated file.
     */
    static FlatVectorStore load(const std::string& path, uint64_t& next_id);

private:
    size_t dimension_;
    std::vector<uint64_t> ids_;                   // Slot -> id.
    std::vector<float> data_;                     // Slot-major, dimension_ floats per slot.
    std::unordered_map<uint64_t, size_t> slots_;  // Id -> slot.
};

// Returns the L2 norm of v.
float l2_norm(const std::vector<float>& v);

// Scales v to unit length in place. Returns false if v is all zeros.
bool normalize(std::vector<float>& v);

} // namespace quarry
