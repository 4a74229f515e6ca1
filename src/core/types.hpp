#pragma once

#include <string>
#include <optional>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include "constants.hpp"

// Failure categories shared by the storage and sync layers
enum class ErrorKind {
    None,
    Timeout,              // remote op exceeded its deadline
    Backend,              // backend reported an error or rejected the value
    BackendUnavailable,   // no usable remote backend
    Corruption,           // metadata present but chunks missing or unparsable
    Conflict,             // server revision ahead of local
};

const char* error_kind_name(ErrorKind kind);

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

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::Backend) {
        return {false, T{}, err, kind};
    }

    // Re-wrap the error of another result (value type may differ)
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
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

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::Backend) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Thrown by foreground operations once every fallback is exhausted
class SyncError : public std::runtime_error {
public:
    SyncError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Configuration structures
struct StorageConfig {
    std::string base_key = DEFAULT_BASE_KEY;
    std::string local_path;                  // YAML file backing the local cache
    std::string fallback_path;               // stands in for the remote when it is unavailable
};

struct RemoteConfig {
    std::string path;                        // file backend location ("" = unavailable)
    size_t max_value_size = DEFAULT_MAX_CHUNK_SIZE;  // per-item limit imposed by the backend
    int timeout_ms = REMOTE_OP_TIMEOUT_MS;
};

struct SyncConfig {
    int throttle_ms = PUSH_THROTTLE_MS;
    int interval_ms = PERIODIC_SYNC_MS;
    int chunk_delay_ms = CHUNK_WRITE_DELAY_MS;
};

struct LogConfig {
    std::string path;                        // "" = temp dir default
};
