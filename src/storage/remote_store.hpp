#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <core/types.hpp>
#include "kv_backend.hpp"

class LocalStore;

// Synchronous, deadline-bounded view of an asynchronous KvBackend.
//
// The backend is chosen once at construction: the primary if it reports
// itself available, otherwise the local fallback. A backend completion that
// arrives after the deadline is discarded.
class RemoteStore {
public:
    RemoteStore(KvBackend* primary, LocalStore& fallback, int timeout_ms);

    Result<void> set(const std::string& key, const std::string& value);
    Result<std::optional<std::string>> get(const std::string& key);
    Result<void> remove(const std::string& key);
    Result<std::vector<std::string>> keys();

    // Remove every key, best-effort. Returns the number of keys removed.
    Result<size_t> clear();

    size_t max_value_size() const;
    bool is_fallback() const { return is_fallback_; }
    std::string storage_type() const { return is_fallback_ ? "local" : "remote"; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    KvBackend* backend_;
    bool is_fallback_;
    std::chrono::milliseconds timeout_;
};
