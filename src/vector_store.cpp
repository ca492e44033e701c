#include "vector_store.hpp"
#include "atomic_file.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace quarry {

namespace {

constexpr char VECTOR_MAGIC[4] = {'Q', 'V', 'E', 'C'};
constexpr uint32_t VECTOR_FORMAT_VERSION = 1;

template <typename T>
void write_pod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
void read_pod(std::istream& in, T& value, const std::string& path) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) {
        throw std::runtime_error("Truncated vector file: " + path);
    }
}

} // namespace

float l2_norm(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    return static_cast<float>(std::sqrt(sum));
}

bool normalize(std::vector<float>& v) {
    float norm = l2_norm(v);
    if (norm == 0.0f) {
        return false;
    }
    for (auto& x : v) {
        x /= norm;
    }
    return true;
}

FlatVectorStore::FlatVectorStore(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("Vector dimension must be positive");
    }
}

void FlatVectorStore::insert(uint64_t id, const std::vector<float>& vector) {
    if (vector.size() != dimension_) {
        throw IndexWriteError("Vector has dimension " + std::to_string(vector.size()) +
                              ", index expects " + std::to_string(dimension_));
    }
    if (std::fabs(l2_norm(vector) - 1.0f) > NORM_TOLERANCE) {
        throw IndexWriteError("Vector for id " + std::to_string(id) + " is not unit-length");
    }
    if (contains(id)) {
        throw IndexWriteError("Duplicate vector id " + std::to_string(id));
    }

    slots_[id] = ids_.size();
    ids_.push_back(id);
    data_.insert(data_.end(), vector.begin(), vector.end());
}

bool FlatVectorStore::remove(uint64_t id) {
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return false;
    }

    size_t slot = it->second;
    size_t last = ids_.size() - 1;
    if (slot != last) {
        // Move the last vector into the freed slot
        std::copy(data_.begin() + last * dimension_,
                  data_.begin() + (last + 1) * dimension_,
                  data_.begin() + slot * dimension_);
        ids_[slot] = ids_[last];
        slots_[ids_[slot]] = slot;
    }

    ids_.pop_back();
    data_.resize(ids_.size() * dimension_);
    slots_.erase(id);
    return true;
}

std::vector<ScoredId> FlatVectorStore::search(const std::vector<float>& query, size_t over_k) const {
    if (query.size() != dimension_) {
        throw std::invalid_argument("Query has dimension " + std::to_string(query.size()) +
                                    ", index expects " + std::to_string(dimension_));
    }

    std::vector<ScoredId> hits;
    hits.reserve(ids_.size());
    for (size_t slot = 0; slot < ids_.size(); ++slot) {
        const float* row = data_.data() + slot * dimension_;
        double dot = 0.0;
        for (size_t i = 0; i < dimension_; ++i) {
            dot += static_cast<double>(row[i]) * query[i];
        }
        float score = std::clamp(static_cast<float>(dot), -1.0f, 1.0f);
        hits.push_back({ids_[slot], score});
    }

    auto better = [](const ScoredId& a, const ScoredId& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.id < b.id;
    };

    size_t k = std::min(over_k, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + k, hits.end(), better);
    hits.resize(k);
    return hits;
}

void FlatVectorStore::save(const std::string& path, uint64_t next_id) const {
    write_file_atomically(path, [&](std::ostream& out) {
        out.write(VECTOR_MAGIC, sizeof(VECTOR_MAGIC));
        write_pod(out, VECTOR_FORMAT_VERSION);
        write_pod(out, static_cast<uint32_t>(dimension_));
        write_pod(out, next_id);
        write_pod(out, static_cast<uint64_t>(ids_.size()));
        for (size_t slot = 0; slot < ids_.size(); ++slot) {
            write_pod(out, ids_[slot]);
            out.write(reinterpret_cast<const char*>(data_.data() + slot * dimension_),
                      static_cast<std::streamsize>(dimension_ * sizeof(float)));
        }
    }, true);
}

FlatVectorStore FlatVectorStore::load(const std::string& path, uint64_t& next_id) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open vector file: " + path);
    }

    char magic[4];
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, VECTOR_MAGIC, sizeof(magic)) != 0) {
        throw std::runtime_error("Not a quarry vector file: " + path);
    }

    uint32_t version = 0;
    uint32_t dimension = 0;
    uint64_t count = 0;
    read_pod(in, version, path);
    if (version != VECTOR_FORMAT_VERSION) {
        throw std::runtime_error("Unsupported vector file version " + std::to_string(version) +
                                 " in " + path);
    }
    read_pod(in, dimension, path);
    read_pod(in, next_id, path);
    read_pod(in, count, path);
    if (dimension == 0) {
        throw std::runtime_error("Vector file has zero dimension: " + path);
    }

    FlatVectorStore store(dimension);
    std::vector<float> vector(dimension);
    for (uint64_t i = 0; i < count; ++i) {
        uint64_t id = 0;
        read_pod(in, id, path);
        in.read(reinterpret_cast<char*>(vector.data()),
                static_cast<std::streamsize>(dimension * sizeof(float)));
        if (!in) {
            throw std::runtime_error("Truncated vector file: " + path);
        }
        if (store.contains(id)) {
            throw std::runtime_error("Duplicate id " + std::to_string(id) + " in " + path);
        }
        store.slots_[id] = store.ids_.size();
        store.ids_.push_back(id);
        store.data_.insert(store.data_.end(), vector.begin(), vector.end());
    }
    return store;
}

} // namespace quarry
