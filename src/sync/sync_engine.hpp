#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/types.hpp>
#include "remote_metadata.hpp"
#include "revision_tracker.hpp"

class LocalStore;
class RemoteStore;

// Revision-based mirror of the local payload onto a size-limited remote store.
//
// Writes land in the LocalStore first and are pushed in the background as a
// metadata record followed by fixed-size chunks. A background worker thread
// serves push requests from save_locally() and, once started, the periodic
// sync tick. push_to_remote() is throttled and never runs twice at once.
class SyncEngine {
public:
    SyncEngine(LocalStore& local, RemoteStore& remote, RevisionTracker& tracker,
               const std::string& base_key, const SyncConfig& config,
               size_t max_chunk_size);
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    // Startup: migrate legacy remote data, pick local or remote payload,
    // seed the default deck if neither exists, start the periodic sync.
    // Throws SyncError only if the local store cannot be written.
    std::string initialize();

    // Persist locally and schedule a background push if local is ahead.
    // Throws SyncError if the local store cannot be written.
    void save_locally(const std::string& payload, bool increment_revision = true);

    std::optional<std::string> load_local() const;

    // Read the remote payload and adopt it locally. Any failure (missing
    // metadata, missing chunk, timeout) yields nullopt and leaves the local
    // cache untouched.
    std::optional<std::string> pull_from_remote();

    // Foreground variant of pull_from_remote with typed errors. Migrates a
    // legacy layout first. Ok(nullopt) means the remote holds no data.
    Result<std::optional<std::string>> force_pull();

    // Write local changes to the remote. Returns false when throttled, when
    // another push is in flight, or on failure (recorded in the sync status).
    bool push_to_remote();

    // Convert a legacy remote layout to the current one. Ok(false) if there
    // was nothing to migrate.
    Result<bool> migrate_legacy();

    // Wait out the throttle window and any in-flight push, then push.
    bool sync_now(int timeout_ms = FLUSH_TIMEOUT_MS);

    // Block until no push is requested or running. Returns false on timeout.
    bool flush(int timeout_ms = FLUSH_TIMEOUT_MS);

    void start_periodic_sync();
    void stop_periodic_sync();
    bool periodic_sync_running() const;

    // Drop revisions and the local payload; optionally clear the remote too.
    Result<void> reset(bool clear_remote);

    RevisionState sync_status() const { return tracker_.state(); }
    RevisionTracker::Unsubscribe subscribe(RevisionTracker::Listener listener) {
        return tracker_.subscribe(std::move(listener));
    }

    size_t chunk_size() const { return chunk_size_; }
    std::chrono::milliseconds throttle_remaining() const;

private:
    struct RemoteSnapshot {
        std::string payload;
        uint64_t revision = 0;
    };

    LocalStore& local_;
    RemoteStore& remote_;
    RevisionTracker& tracker_;
    std::string base_key_;
    SyncConfig config_;
    size_t chunk_size_;

    // Worker and push bookkeeping, all guarded by mutex_
    mutable std::mutex mutex_;
    std::condition_variable worker_cv_;
    std::condition_variable idle_cv_;
    bool stopping_ = false;
    bool periodic_enabled_ = false;
    bool push_requested_ = false;
    bool worker_busy_ = false;
    bool push_in_flight_ = false;
    std::optional<std::chrono::steady_clock::time_point> last_push_attempt_;
    std::chrono::steady_clock::time_point next_tick_;
    std::thread worker_;

    void worker_loop();
    void request_push();
    bool run_push();
    bool begin_push();
    void end_push();

    // Keys
    std::string meta_key() const;
    std::string batch_key(size_t index) const;
    std::string legacy_batch_key(size_t index) const;
    std::string data_key() const;
    std::string data_timestamp_key() const;

    Result<void> store_payload(const std::string& payload);
    Result<std::optional<RemoteMetadata>> read_metadata();
    Result<std::optional<RemoteSnapshot>> fetch_remote();
    Result<bool> migrate_from(const std::optional<RemoteMetadata>& meta);
    Result<MetadataV1> write_payload(const std::string& payload, uint64_t revision,
                                     uint64_t previous_batches);
    std::string seed_default_payload();
};
