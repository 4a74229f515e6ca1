#include "sync_context.hpp"
#include <core/log.hpp>
#include <storage/file_backend.hpp>
#include <fmt/format.h>

SyncContext::SyncContext(const Config& config, std::unique_ptr<KvBackend> backend)
    : config_(config), backend_(std::move(backend)) {
    if (!config_.log().path.empty()) {
        set_log_path(config_.log().path);
    }

    const auto& storage = config_.storage();
    local_ = std::make_unique<LocalStore>(storage.local_path);
    fallback_ = std::make_unique<LocalStore>(storage.fallback_path);
    remote_ = std::make_unique<RemoteStore>(backend_.get(), *fallback_, config_.remote().timeout_ms);
    tracker_ = std::make_unique<RevisionTracker>(*local_, storage.base_key);
    engine_ = std::make_unique<SyncEngine>(*local_, *remote_, *tracker_, storage.base_key,
                                           config_.sync(), config_.remote().max_value_size);
}

SyncContext::~SyncContext() {
    close();
}

std::unique_ptr<SyncContext> SyncContext::open(const Config& config) {
    std::unique_ptr<KvBackend> backend;
    if (!config.remote().path.empty()) {
        backend = std::make_unique<FileBackend>(config.remote().path, config.remote().max_value_size);
    } else {
        cardsync_log("sync_context: no remote configured");
    }
    return std::make_unique<SyncContext>(config, std::move(backend));
}

void SyncContext::close() {
    if (closed_) return;
    closed_ = true;

    engine_->stop_periodic_sync();
    if (!engine_->flush()) {
        cardsync_log("sync_context: push still in flight at close");
    }
    auto state = tracker_->state();
    if (state.has_unsaved_changes) {
        cardsync_log(fmt::format("sync_context: closing with unsynced revision {} (server {})",
                                 state.revision_local, state.revision_server));
    }
}
