#pragma once

/**
 * Exception types raised by the quarry core.
 *
 * Each type maps to one failure kind with its own recovery policy:
 * source failures are skipped, refinement failures degrade to heuristics,
 * index write failures roll back a single record, query embedding failures
 * fail a single retrieval, and registry corruption blocks one subject
 * until it is reset.
 */

#include <stdexcept>
#include <string>

namespace quarry {

/**
 * Base class for all errors raised by the quarry core.
 */
class QuarryError : public std::runtime_error {
public:
    explicit QuarryError(const std::string& message)
        : std::runtime_error(message) {}
};

// A fetch or transcription could not produce text for a source.
class SourceUnavailableError : public QuarryError {
public:
    explicit SourceUnavailableError(const std::string& message)
        : QuarryError(message) {}
};

// The refinement collaborator failed or broke its output contract.
class RefinementError : public QuarryError {
public:
    explicit RefinementError(const std::string& message)
        : QuarryError(message) {}
};

// The embedding collaborator failed to produce a vector.
class EmbeddingError : public QuarryError {
public:
    explicit EmbeddingError(const std::string& message)
        : QuarryError(message) {}
};

// A record could not be written to both stores; nothing was committed.
class IndexWriteError : public QuarryError {
public:
    explicit IndexWriteError(const std::string& message)
        : QuarryError(message) {}
};

// Persisted vector and metadata files for a subject disagree or are unreadable.
class IndexCorruptError : public QuarryError {
public:
    IndexCorruptError(const std::string& subject, const std::string& message)
        : QuarryError("Index for '" + subject + "' is corrupt: " + message +
                      " (run 'quarry reset' for this subject)"),
          subject_(subject) {}

    const std::string& subject() const { return subject_; }

private:
    std::string subject_;
};

// Embedding the query text failed; only this retrieval call fails.
class QueryEmbeddingError : public QuarryError {
public:
    explicit QueryEmbeddingError(const std::string& message)
        : QuarryError(message) {}
};

// A registry entry could not be parsed.
class RegistryCorruptError : public QuarryError {
public:
    RegistryCorruptError(const std::string& subject, const std::string& message)
        : QuarryError("Registry entry for '" + subject + "' is corrupt: " + message),
          subject_(subject) {}

    const std::string& subject() const { return subject_; }

private:
    std::string subject_;
};

// The settings file is malformed.
class ConfigError : public QuarryError {
public:
    explicit ConfigError(const std::string& message)
        : QuarryError(message) {}
};

} // namespace quarry
