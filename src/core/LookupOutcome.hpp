/**
 * @file LookupOutcome.hpp
 * @brief Tagged success/failure result used inside the core
 *
 * Public entry points collapse every failure to an empty result, but the
 * internals keep the reason so logs can tell "nothing matched" apart from
 * "upstream was down".
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace locus {

enum class ErrorKind {
    NOT_FOUND,                // Query matched nothing
    UPSTREAM_UNAVAILABLE,     // Network failure or non-2xx
    MALFORMED_UPSTREAM_DATA,  // Unparseable body or coordinates
    INVALID_INPUT             // Rejected before any lookup
};

inline std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "not found";
        case ErrorKind::UPSTREAM_UNAVAILABLE: return "upstream unavailable";
        case ErrorKind::MALFORMED_UPSTREAM_DATA: return "malformed upstream data";
        case ErrorKind::INVALID_INPUT: return "invalid input";
    }
    return "unknown";
}

template<typename T>
class LookupOutcome {
public:
    static LookupOutcome ok(T value) {
        LookupOutcome outcome;
        outcome.value_ = std::move(value);
        return outcome;
    }

    static LookupOutcome fail(ErrorKind kind, std::string reason = "") {
        LookupOutcome outcome;
        outcome.error_ = kind;
        outcome.reason_ = std::move(reason);
        return outcome;
    }

    bool is_ok() const { return value_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    /**
     * @brief Error kind; only meaningful when !is_ok()
     */
    ErrorKind error() const { return error_; }
    const std::string& reason() const { return reason_; }

    /**
     * @brief Drop the failure reason at a public boundary
     */
    std::optional<T> to_optional() && { return std::move(value_); }

    std::string describe() const {
        if (is_ok()) return "ok";
        return reason_.empty() ? to_string(error_) : to_string(error_) + ": " + reason_;
    }

private:
    LookupOutcome() = default;

    std::optional<T> value_;
    ErrorKind error_ = ErrorKind::NOT_FOUND;
    std::string reason_;
};

} // namespace locus
