#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

class LocalStore;

struct RevisionState {
    uint64_t revision_local = 0;
    uint64_t revision_server = 0;
    bool has_unsaved_changes = false;    // always revision_local > revision_server
    bool is_syncing = false;
    std::optional<std::string> last_sync_error;
    std::optional<std::string> last_sync_attempt;   // ISO timestamps
    std::optional<std::string> last_saved;
    std::optional<std::string> last_modified;
};

// Owns the local/server revision counters and the sync status flags.
//
// Counters and timestamps are persisted in the LocalStore under
// `{base}_revision`, `{base}_server_revision`, `{base}_last_modified` and
// `{base}_last_saved`; this class is their only writer. Every mutation is
// published to subscribers, outside the internal lock.
class RevisionTracker {
public:
    using Listener = std::function<void(const RevisionState&)>;
    using Unsubscribe = std::function<void()>;

    RevisionTracker(LocalStore& store, const std::string& base_key);

    RevisionState state() const;

    // Negative input is coerced to 0
    void set_local_revision(int64_t revision);
    void set_server_revision(int64_t revision);
    void increment_local_revision();

    // Sync attempt: Idle -> Syncing -> {Synced | Failed} -> Idle
    void mark_as_syncing();
    void mark_as_synced(std::optional<uint64_t> server_revision = std::nullopt);
    void mark_sync_failed(const std::string& reason);

    // Local state was replaced by server data at `revision`
    void mark_data_updated_from_server(uint64_t revision);

    bool needs_cloud_write() const;
    bool needs_cloud_read() const;

    // Zero both counters, clear timestamps and persisted copies
    void reset();

    // The listener is called immediately with the current state. The returned
    // handle must not be invoked after the tracker is destroyed.
    Unsubscribe subscribe(Listener listener);

private:
    LocalStore& store_;
    std::string base_key_;

    mutable std::mutex mutex_;
    RevisionState state_;
    std::map<int, Listener> listeners_;
    int next_listener_id_ = 0;

    void load();
    void persist_counter(const char* key_template, uint64_t value);
    void persist_timestamp(const char* key_template, const std::string& value);
    void recompute_locked();
    void notify();
};
