#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include "kv_backend.hpp"

namespace fs = std::filesystem;

// Durable string map persisted as a YAML file.
//
// Serves two roles: the synchronous local cache (payload, revision counters,
// timestamps) and the fallback backend when no remote is reachable. Every
// mutation rewrites the file atomically. An empty path keeps the map in
// memory only.
class LocalStore : public KvBackend {
public:
    explicit LocalStore(const fs::path& path = fs::path());

    // Synchronous API
    std::optional<std::string> get(const std::string& key) const;
    Result<void> set(const std::string& key, const std::string& value);
    Result<void> remove(const std::string& key);
    std::vector<std::string> keys() const;
    Result<void> clear();

    const fs::path& path() const { return path_; }

    // KvBackend: callbacks fire inline, before the call returns
    bool is_available() const override { return true; }
    size_t max_value_size() const override;
    void set_item(const std::string& key, const std::string& value, DoneCallback done) override;
    void get_item(const std::string& key, ValueCallback done) override;
    void remove_item(const std::string& key, DoneCallback done) override;
    void get_keys(KeysCallback done) override;

private:
    fs::path path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> items_;

    void load();
    Result<void> persist_locked();
};
