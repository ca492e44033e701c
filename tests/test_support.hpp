#pragma once

/**
 * Test doubles for the quarry collaborator interfaces.
 */

#include "errors.hpp"
#include "providers/hashing_embedder.hpp"
#include "providers/provider.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace quarry::testing {

constexpr size_t TEST_DIMENSION = 64;

/**
 * Hashing embedder with per-text overrides. A pinned text maps to a unit
 * basis vector, so texts pinned to the same axis have similarity 1 and
 * texts on different axes have similarity 0.
 */
class FakeEmbedder : public providers::IEmbedder {
public:
    FakeEmbedder() : fallback_(TEST_DIMENSION) {}

    void pin(const std::string& text, size_t axis) { pinned_[text] = axis; }
    void fail_on(const std::string& text) { failing_.insert(text); }

    std::vector<float> embed(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            ++calls;
        }
        if (failing_.count(text) > 0) {
            throw EmbeddingError("refusing to embed '" + text + "'");
        }
        auto it = pinned_.find(text);
        if (it != pinned_.end()) {
            std::vector<float> v(TEST_DIMENSION, 0.0f);
            v[it->second] = 1.0f;
            return v;
        }
        return fallback_.embed(text);
    }

    size_t dimension() const override { return TEST_DIMENSION; }
    std::string model() const override { return "fake"; }

    size_t calls = 0;

private:
    std::mutex calls_mutex_;
    providers::HashingEmbedder fallback_;
    std::map<std::string, size_t> pinned_;
    std::set<std::string> failing_;
};

// Serves article text from a map; unknown URLs are unavailable.
class FakeFetcher : public providers::IFetcher {
public:
    std::map<std::string, std::string> pages;
    std::vector<std::string> requested;

    std::string fetch(const std::string& url, const providers::FetchOptions&) override {
        {
            std::lock_guard<std::mutex> lock(requested_mutex_);
            requested.push_back(url);
        }
        auto it = pages.find(url);
        if (it == pages.end()) {
            throw SourceUnavailableError("404 for " + url);
        }
        return it->second;
    }

private:
    std::mutex requested_mutex_;
};

/**
 * Fetcher that can hold callers inside fetch(). While the gate is closed
 * every fetch blocks until open() is called; hold keeps each fetch in
 * flight a little longer so overlapping calls would be observed.
 */
class GatedFetcher : public providers::IFetcher {
public:
    std::map<std::string, std::string> pages;
    std::chrono::milliseconds hold{0};

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    // True once at least n fetches are in progress together.
    bool wait_for_in_flight(size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return in_flight_ >= n; });
    }

    size_t max_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_in_flight_;
    }

    std::string fetch(const std::string& url, const providers::FetchOptions&) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++in_flight_;
            max_in_flight_ = std::max(max_in_flight_, in_flight_);
            cv_.notify_all();
            cv_.wait(lock, [&] { return open_; });
        }
        std::this_thread::sleep_for(hold);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
        }

        auto it = pages.find(url);
        if (it == pages.end()) {
            throw SourceUnavailableError("404 for " + url);
        }
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = true;
    size_t in_flight_ = 0;
    size_t max_in_flight_ = 0;
};

// Serves transcripts from a map keyed by location.
class FakeTranscriber : public providers::ITranscriber {
public:
    std::map<std::string, providers::Transcript> transcripts;

    providers::Transcript transcribe(const std::string& location,
                                     const providers::FetchOptions&) override {
        auto it = transcripts.find(location);
        if (it == transcripts.end()) {
            throw SourceUnavailableError("no transcript for " + location);
        }
        return it->second;
    }
};

// Refiner whose behavior is supplied by the test.
class FakeRefiner : public providers::IRefiner {
public:
    using Handler = std::function<std::vector<std::string>(const std::vector<std::string>&)>;

    explicit FakeRefiner(Handler handler) : handler_(std::move(handler)) {}

    std::vector<std::string> refine(const std::vector<std::string>& batch) override {
        batches.push_back(batch);
        return handler_(batch);
    }

    std::vector<std::vector<std::string>> batches;

private:
    Handler handler_;
};

/**
 * Fresh directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("quarry_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

// Unit vector along one axis of the test dimension.
inline std::vector<float> axis_vector(size_t axis, size_t dimension = TEST_DIMENSION) {
    std::vector<float> v(dimension, 0.0f);
    v[axis] = 1.0f;
    return v;
}

} // namespace quarry::testing
