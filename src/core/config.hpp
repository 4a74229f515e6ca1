#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load config from the given YAML file (default ~/.cardsync/config.yaml).
    // A missing file yields the built-in defaults.
    static Result<Config> load(const fs::path& path = fs::path());

    // Parse config from YAML text (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const StorageConfig& storage() const { return storage_; }
    const RemoteConfig& remote() const { return remote_; }
    const SyncConfig& sync() const { return sync_; }
    const LogConfig& log() const { return log_; }
    const fs::path& source_path() const { return source_path_; }

    // Overrides (CLI flags, tests)
    StorageConfig& storage() { return storage_; }
    RemoteConfig& remote() { return remote_; }
    SyncConfig& sync() { return sync_; }

public:
    Config();

private:
    StorageConfig storage_;
    RemoteConfig remote_;
    SyncConfig sync_;
    LogConfig log_;
    fs::path source_path_;
};

// Helper to check if the config exists
bool config_exists(const fs::path& path = fs::path());

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create default config (no-op if the file already exists)
Result<void> create_default_config(const fs::path& path = fs::path());
