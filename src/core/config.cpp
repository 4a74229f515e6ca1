#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

// Expand a leading "~/" against the home directory.
static std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

Config::Config() {
    storage_.local_path = (get_config_dir() / "local.yaml").string();
    storage_.fallback_path = (get_config_dir() / "fallback.yaml").string();
}

bool config_exists(const fs::path& path) {
    return fs::exists(path.empty() ? get_config_path() : path);
}

fs::path get_config_dir() {
    return platform::home_dir() / ".cardsync";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config(const fs::path& path) {
    fs::path config_path = path.empty() ? get_config_path() : path;

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# cardsync configuration

storage:
  base_key: "cards"                # prefix of every stored key
  local_path: "~/.cardsync/local.yaml"
  fallback_path: "~/.cardsync/fallback.yaml"   # used while no remote is configured

remote:
  path: ""                         # shared key-value file; empty = local only
  max_value_size: 1500             # per-item limit of the backend
  timeout_ms: 10000

sync:
  throttle_ms: 5000                # min interval between push attempts
  interval_ms: 10000               # background sync tick
  chunk_delay_ms: 100              # pause between chunk writes

# Optional: debug log location (default: /tmp/cardsync_debug.log)
# log:
#   path: "~/.cardsync/debug.log"
)";

    if (!platform::write_file_atomic(config_path, default_config)) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

static void parse_storage_config(const YAML::Node& node, StorageConfig& storage) {
    storage.base_key = node["base_key"].as<std::string>(storage.base_key);
    if (node["local_path"]) {
        storage.local_path = expand_home(node["local_path"].as<std::string>());
    }
    if (node["fallback_path"]) {
        storage.fallback_path = expand_home(node["fallback_path"].as<std::string>());
    }
}

static void parse_remote_config(const YAML::Node& node, RemoteConfig& remote) {
    remote.path = expand_home(node["path"].as<std::string>(""));
    remote.max_value_size = node["max_value_size"].as<size_t>(remote.max_value_size);
    remote.timeout_ms = node["timeout_ms"].as<int>(remote.timeout_ms);
}

static void parse_sync_config(const YAML::Node& node, SyncConfig& sync) {
    sync.throttle_ms = node["throttle_ms"].as<int>(sync.throttle_ms);
    sync.interval_ms = node["interval_ms"].as<int>(sync.interval_ms);
    sync.chunk_delay_ms = node["chunk_delay_ms"].as<int>(sync.chunk_delay_ms);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;

    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        if (root["storage"] && root["storage"].IsMap()) {
            parse_storage_config(root["storage"], config.storage_);
        }
        if (root["remote"] && root["remote"].IsMap()) {
            parse_remote_config(root["remote"], config.remote_);
        }
        if (root["sync"] && root["sync"].IsMap()) {
            parse_sync_config(root["sync"], config.sync_);
        }
        if (root["log"] && root["log"].IsMap()) {
            config.log_.path = expand_home(root["log"]["path"].as<std::string>(""));
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Invalid config: " + std::string(e.what()));
    }

    if (config.storage_.base_key.empty()) {
        return Result<Config>::Err("storage.base_key must not be empty");
    }
    if (config.remote_.max_value_size == 0) {
        return Result<Config>::Err("remote.max_value_size must be positive");
    }
    if (config.remote_.timeout_ms <= 0) {
        return Result<Config>::Err("remote.timeout_ms must be positive");
    }
    if (config.sync_.throttle_ms < 0 || config.sync_.interval_ms <= 0 ||
        config.sync_.chunk_delay_ms < 0) {
        return Result<Config>::Err("sync intervals must not be negative");
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    fs::path config_path = path.empty() ? get_config_path() : path;

    if (!fs::exists(config_path)) {
        Config config;
        config.source_path_ = config_path;
        return Result<Config>::Ok(config);
    }

    std::ifstream in(config_path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + config_path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(config_path.string() + ": " + result.error);
    }
    result.value.source_path_ = config_path;
    return result;
}
