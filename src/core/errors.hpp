/**
 * @file    errors.hpp
 * @brief   Error taxonomy for mark embedding, extraction and crop recovery
 * @license MIT
 *
 * @details
 * Every failure surfaced by the library is a MarkError carrying a stable
 * kind tag plus a human-readable detail string. A wrong bit length at
 * extraction is deliberately NOT an error (see plausibility_ratio).
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace dmt {

enum class ErrorKind {
    Validation,     // Missing/malformed input, rejected before delegation
    Capability,     // External transform/matcher/attack capability faulted
    NoMatch,        // Matching finished but confidence below floor
    Timeout,        // Delegation exceeded its deadline
    Cancelled,      // Caller cancelled the delegation
    Io,             // Artifact store read/write failure
};

/**
 * Stable tag used in logs and structured error output
 */
std::string_view to_string(ErrorKind kind) noexcept;

class MarkError : public std::runtime_error {
public:
    MarkError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    std::string_view tag() const noexcept { return to_string(kind_); }

private:
    ErrorKind kind_;
};

class ValidationError : public MarkError {
public:
    explicit ValidationError(const std::string& detail)
        : MarkError(ErrorKind::Validation, detail) {}
};

class CapabilityError : public MarkError {
public:
    explicit CapabilityError(const std::string& detail)
        : MarkError(ErrorKind::Capability, detail) {}
};

class NoMatchError : public MarkError {
public:
    NoMatchError(const std::string& detail, double best_score)
        : MarkError(ErrorKind::NoMatch, detail), best_score_(best_score) {}

    double best_score() const noexcept { return best_score_; }

private:
    double best_score_;
};

class TimeoutError : public MarkError {
public:
    explicit TimeoutError(const std::string& detail)
        : MarkError(ErrorKind::Timeout, detail) {}
};

class CancelledError : public MarkError {
public:
    explicit CancelledError(const std::string& detail)
        : MarkError(ErrorKind::Cancelled, detail) {}
};

class IoError : public MarkError {
public:
    explicit IoError(const std::string& detail)
        : MarkError(ErrorKind::Io, detail) {}
};

}  // namespace dmt
