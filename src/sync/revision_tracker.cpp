#include "revision_tracker.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <storage/local_store.hpp>
#include <fmt/format.h>
#include <vector>

RevisionTracker::RevisionTracker(LocalStore& store, const std::string& base_key)
    : store_(store), base_key_(base_key) {
    load();
}

void RevisionTracker::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.revision_local = parse_revision(store_.get(fmt::format(KEY_REVISION, base_key_)).value_or(""));
    state_.revision_server = parse_revision(store_.get(fmt::format(KEY_SERVER_REV, base_key_)).value_or(""));
    state_.last_modified = store_.get(fmt::format(KEY_LAST_MODIFIED, base_key_));
    state_.last_saved = store_.get(fmt::format(KEY_LAST_SAVED, base_key_));
    recompute_locked();
    cardsync_log(fmt::format("revision_tracker: loaded local={} server={}",
                             state_.revision_local, state_.revision_server));
}

// ── Persistence ────────────────────────────────────────────

void RevisionTracker::persist_counter(const char* key_template, uint64_t value) {
    auto r = store_.set(fmt::format(fmt::runtime(key_template), base_key_), std::to_string(value));
    if (r.is_err()) {
        cardsync_log("revision_tracker: " + r.error);
    }
}

void RevisionTracker::persist_timestamp(const char* key_template, const std::string& value) {
    auto r = store_.set(fmt::format(fmt::runtime(key_template), base_key_), value);
    if (r.is_err()) {
        cardsync_log("revision_tracker: " + r.error);
    }
}

void RevisionTracker::recompute_locked() {
    state_.has_unsaved_changes = state_.revision_local > state_.revision_server;
}

// ── Counters ───────────────────────────────────────────────

RevisionState RevisionTracker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void RevisionTracker::set_local_revision(int64_t revision) {
    uint64_t value = revision < 0 ? 0 : static_cast<uint64_t>(revision);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.revision_local = value;
        recompute_locked();
        persist_counter(KEY_REVISION, value);
    }
    notify();
}

void RevisionTracker::set_server_revision(int64_t revision) {
    uint64_t value = revision < 0 ? 0 : static_cast<uint64_t>(revision);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.revision_server = value;
        recompute_locked();
        persist_counter(KEY_SERVER_REV, value);
    }
    notify();
}

void RevisionTracker::increment_local_revision() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.revision_local += 1;
        state_.last_modified = now_iso();
        recompute_locked();
        persist_counter(KEY_REVISION, state_.revision_local);
        persist_timestamp(KEY_LAST_MODIFIED, *state_.last_modified);
    }
    notify();
}

// ── Sync status ────────────────────────────────────────────

void RevisionTracker::mark_as_syncing() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.is_syncing = true;
        state_.last_sync_attempt = now_iso();
    }
    notify();
}

void RevisionTracker::mark_as_synced(std::optional<uint64_t> server_revision) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (server_revision) {
            state_.revision_server = *server_revision;
            persist_counter(KEY_SERVER_REV, *server_revision);
        }
        state_.is_syncing = false;
        state_.last_sync_error.reset();
        state_.last_saved = now_iso();
        recompute_locked();
        persist_timestamp(KEY_LAST_SAVED, *state_.last_saved);
    }
    cardsync_log("revision_tracker: synced");
    notify();
}

void RevisionTracker::mark_sync_failed(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.is_syncing = false;
        state_.last_sync_error = reason;
        // has_unsaved_changes stays as the counters say
    }
    cardsync_log("revision_tracker: sync failed: " + reason);
    notify();
}

void RevisionTracker::mark_data_updated_from_server(uint64_t revision) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.revision_local = revision;
        state_.revision_server = revision;
        recompute_locked();
        persist_counter(KEY_REVISION, revision);
        persist_counter(KEY_SERVER_REV, revision);
    }
    cardsync_log(fmt::format("revision_tracker: adopted server revision {}", revision));
    notify();
}

bool RevisionTracker::needs_cloud_write() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.revision_local > state_.revision_server;
}

bool RevisionTracker::needs_cloud_read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.revision_local <= state_.revision_server;
}

void RevisionTracker::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = RevisionState{};
        for (const char* key : {KEY_REVISION, KEY_SERVER_REV, KEY_LAST_MODIFIED, KEY_LAST_SAVED}) {
            auto r = store_.remove(fmt::format(fmt::runtime(key), base_key_));
            if (r.is_err()) {
                cardsync_log("revision_tracker: " + r.error);
            }
        }
    }
    cardsync_log("revision_tracker: reset");
    notify();
}

// ── Subscribers ────────────────────────────────────────────

RevisionTracker::Unsubscribe RevisionTracker::subscribe(Listener listener) {
    int id;
    RevisionState current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_listener_id_++;
        listeners_[id] = listener;
        current = state_;
    }

    try {
        listener(current);
    } catch (const std::exception& e) {
        cardsync_log(fmt::format("revision_tracker: listener {} threw: {}", id, e.what()));
    }

    return [this, id] {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(id);
    };
}

void RevisionTracker::notify() {
    std::vector<std::pair<int, Listener>> listeners;
    RevisionState current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners.assign(listeners_.begin(), listeners_.end());
        current = state_;
    }

    for (const auto& [id, listener] : listeners) {
        try {
            listener(current);
        } catch (const std::exception& e) {
            cardsync_log(fmt::format("revision_tracker: listener {} threw: {}", id, e.what()));
        }
    }
}
