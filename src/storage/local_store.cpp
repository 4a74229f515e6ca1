#include "local_store.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <limits>

LocalStore::LocalStore(const fs::path& path) : path_(path) {
    load();
}

void LocalStore::load() {
    if (path_.empty() || !fs::exists(path_)) {
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        if (root["items"] && root["items"].IsMap()) {
            for (const auto& kv : root["items"]) {
                items_[kv.first.as<std::string>()] = kv.second.as<std::string>("");
            }
        }
    } catch (const std::exception& e) {
        // Corrupted store file — start fresh
        cardsync_log(fmt::format("local_store: discarding unreadable {}: {}",
                                 path_.string(), e.what()));
        items_.clear();
    }
}

Result<void> LocalStore::persist_locked() {
    if (path_.empty()) {
        return Result<void>::Ok();
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "items" << YAML::Value << YAML::BeginMap;
    for (const auto& [key, value] : items_) {
        out << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << value;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    if (!platform::write_file_atomic(path_, out.c_str())) {
        return Result<void>::Err("Failed to write local store " + path_.string());
    }
    return Result<void>::Ok();
}

std::optional<std::string> LocalStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

Result<void> LocalStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_[key] = value;
    return persist_locked();
}

Result<void> LocalStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.erase(key) == 0) {
        return Result<void>::Ok();
    }
    return persist_locked();
}

std::vector<std::string> LocalStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (const auto& kv : items_) out.push_back(kv.first);
    return out;
}

Result<void> LocalStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
    return persist_locked();
}

// ── KvBackend ──────────────────────────────────────────────

size_t LocalStore::max_value_size() const {
    return std::numeric_limits<size_t>::max();
}

void LocalStore::set_item(const std::string& key, const std::string& value, DoneCallback done) {
    auto r = set(key, value);
    done(r.is_ok() ? std::nullopt : std::optional<std::string>(r.error));
}

void LocalStore::get_item(const std::string& key, ValueCallback done) {
    done(std::nullopt, get(key));
}

void LocalStore::remove_item(const std::string& key, DoneCallback done) {
    auto r = remove(key);
    done(r.is_ok() ? std::nullopt : std::optional<std::string>(r.error));
}

void LocalStore::get_keys(KeysCallback done) {
    done(std::nullopt, keys());
}
