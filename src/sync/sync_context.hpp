#pragma once

#include <memory>
#include <core/config.hpp>
#include <storage/kv_backend.hpp>
#include <storage/local_store.hpp>
#include <storage/remote_store.hpp>
#include "revision_tracker.hpp"
#include "sync_engine.hpp"

// Everything the sync layer needs, built once at startup and handed to
// callers by reference. Members are declared in dependency order so
// destruction runs engine first, stores last.
class SyncContext {
public:
    // `backend` overrides the one described by config.remote (tests, embedding)
    explicit SyncContext(const Config& config, std::unique_ptr<KvBackend> backend = nullptr);
    ~SyncContext();

    SyncContext(const SyncContext&) = delete;
    SyncContext& operator=(const SyncContext&) = delete;

    // Build from config: a FileBackend when remote.path is set.
    static std::unique_ptr<SyncContext> open(const Config& config);

    // Stop the periodic sync and wait for an in-flight push. Idempotent.
    void close();

    SyncEngine& engine() { return *engine_; }
    RevisionTracker& tracker() { return *tracker_; }
    RemoteStore& remote() { return *remote_; }
    LocalStore& local() { return *local_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    std::unique_ptr<KvBackend> backend_;
    std::unique_ptr<LocalStore> local_;
    std::unique_ptr<LocalStore> fallback_;
    std::unique_ptr<RemoteStore> remote_;
    std::unique_ptr<RevisionTracker> tracker_;
    std::unique_ptr<SyncEngine> engine_;
    bool closed_ = false;
};
