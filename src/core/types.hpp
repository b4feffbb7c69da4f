#pragma once

#include <string>
#include <utility>

// Error categories carried by Result so callers can branch without matching
// on message text.
enum class ErrorKind {
    None,
    NotFound,         // key absent (normal cache miss)
    Expired,          // key present but past its TTL
    Disabled,         // store configured off
    InvalidKey,       // empty key
    InvalidArgument,
    Io,
    Parse,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::Io) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool is(ErrorKind k) const { return !success && kind == k; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::Io) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    bool is(ErrorKind k) const { return !success && kind == k; }
};

const char* error_kind_name(ErrorKind kind);
