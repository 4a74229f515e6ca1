#include "sync_engine.hpp"
#include "chunk_codec.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <storage/local_store.hpp>
#include <storage/remote_store.hpp>
#include <fmt/format.h>
#include <algorithm>

using Clock = std::chrono::steady_clock;

SyncEngine::SyncEngine(LocalStore& local, RemoteStore& remote, RevisionTracker& tracker,
                       const std::string& base_key, const SyncConfig& config,
                       size_t max_chunk_size)
    : local_(local), remote_(remote), tracker_(tracker), base_key_(base_key),
      config_(config),
      chunk_size_(std::max<size_t>(1, std::min(max_chunk_size, remote.max_value_size()))) {
    worker_ = std::thread(&SyncEngine::worker_loop, this);
}

SyncEngine::~SyncEngine() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    worker_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

// ── Keys ───────────────────────────────────────────────────

std::string SyncEngine::meta_key() const { return fmt::format(KEY_META, base_key_); }
std::string SyncEngine::batch_key(size_t index) const { return fmt::format(KEY_BATCH, base_key_, index); }
std::string SyncEngine::legacy_batch_key(size_t index) const { return fmt::format(KEY_LEGACY_BATCH, base_key_, index); }
std::string SyncEngine::data_key() const { return fmt::format(KEY_DATA, base_key_); }
std::string SyncEngine::data_timestamp_key() const { return fmt::format(KEY_DATA_TIMESTAMP, base_key_); }

// ── Startup ────────────────────────────────────────────────

std::string SyncEngine::initialize() {
    auto local_payload = load_local();

    auto meta = read_metadata();
    if (meta.is_err()) {
        cardsync_log("sync_engine: metadata unavailable at startup: " + meta.error);
    } else {
        auto migrated = migrate_from(meta.value);
        if (migrated.is_err()) {
            cardsync_log("sync_engine: migration failed: " + migrated.error);
        } else if (!migrated.value && meta.value) {
            tracker_.set_server_revision(static_cast<int64_t>(std::get<MetadataV1>(*meta.value).revision));
        }
    }

    auto state = tracker_.state();
    cardsync_log(fmt::format("sync_engine: initialize local={} server={} local_data={}",
                             state.revision_local, state.revision_server,
                             local_payload ? "yes" : "no"));

    std::string result;
    if (!local_payload && state.revision_server == 0) {
        result = seed_default_payload();
    } else if (!local_payload || state.revision_local <= state.revision_server) {
        auto remote = pull_from_remote();
        if (remote) {
            result = *remote;
        } else if (local_payload) {
            cardsync_log("sync_engine: remote read failed, using local data");
            result = *local_payload;
        } else {
            result = seed_default_payload();
        }
    } else {
        result = *local_payload;
    }

    start_periodic_sync();
    return result;
}

std::string SyncEngine::seed_default_payload() {
    cardsync_log("sync_engine: no data anywhere, seeding default deck");
    save_locally(DEFAULT_PAYLOAD, true);
    return DEFAULT_PAYLOAD;
}

// ── Local cache ────────────────────────────────────────────

std::optional<std::string> SyncEngine::load_local() const {
    return local_.get(data_key());
}

Result<void> SyncEngine::store_payload(const std::string& payload) {
    auto r = local_.set(data_key(), payload);
    if (r.is_err()) return r;
    return local_.set(data_timestamp_key(), now_iso());
}

void SyncEngine::save_locally(const std::string& payload, bool increment_revision) {
    auto r = store_payload(payload);
    if (r.is_err()) {
        throw SyncError(ErrorKind::Backend, "Local save failed: " + r.error);
    }

    if (increment_revision) {
        tracker_.increment_local_revision();
    }
    if (tracker_.needs_cloud_write()) {
        request_push();
    }
}

// ── Remote reads ───────────────────────────────────────────

Result<std::optional<RemoteMetadata>> SyncEngine::read_metadata() {
    using R = Result<std::optional<RemoteMetadata>>;

    auto raw = remote_.get(meta_key());
    if (raw.is_err()) return R::Err(raw);
    if (!raw.value) return R::Ok(std::nullopt);

    auto decoded = decode_metadata(*raw.value);
    if (decoded.is_err()) return R::Err(decoded);
    return R::Ok(decoded.value);
}

Result<std::optional<SyncEngine::RemoteSnapshot>> SyncEngine::fetch_remote() {
    using R = Result<std::optional<RemoteSnapshot>>;

    auto meta = read_metadata();
    if (meta.is_err()) return R::Err(meta);
    if (!meta.value) return R::Ok(std::nullopt);
    if (is_legacy(*meta.value)) {
        return R::Err("remote data uses the legacy layout", ErrorKind::Corruption);
    }

    const auto& v1 = std::get<MetadataV1>(*meta.value);
    std::vector<Chunk> chunks;
    for (size_t i = 0; i < v1.batches; ++i) {
        auto chunk = remote_.get(batch_key(i));
        if (chunk.is_err()) return R::Err(chunk);
        if (!chunk.value) {
            return R::Err(fmt::format("missing chunk {} of {}", i, v1.batches), ErrorKind::Corruption);
        }
        chunks.push_back({i, std::move(*chunk.value)});
    }

    auto joined = chunk_codec::join(std::move(chunks), v1.batches);
    if (joined.is_err()) return R::Err(joined);

    return R::Ok(RemoteSnapshot{std::move(joined.value), v1.revision});
}

std::optional<std::string> SyncEngine::pull_from_remote() {
    auto snapshot = fetch_remote();
    if (snapshot.is_err()) {
        cardsync_log(fmt::format("sync_engine: pull failed ({}): {}",
                                 error_kind_name(snapshot.kind), snapshot.error));
        return std::nullopt;
    }
    if (!snapshot.value) {
        cardsync_log("sync_engine: pull found no remote data");
        return std::nullopt;
    }

    auto stored = store_payload(snapshot.value->payload);
    if (stored.is_err()) {
        cardsync_log("sync_engine: pull could not update local cache: " + stored.error);
        return std::nullopt;
    }
    tracker_.mark_data_updated_from_server(snapshot.value->revision);

    cardsync_log(fmt::format("sync_engine: pulled revision {} ({} chars)",
                             snapshot.value->revision, snapshot.value->payload.size()));
    return std::move(snapshot.value->payload);
}

Result<std::optional<std::string>> SyncEngine::force_pull() {
    using R = Result<std::optional<std::string>>;

    auto migrated = migrate_legacy();
    if (migrated.is_err()) return R::Err(migrated);

    auto snapshot = fetch_remote();
    if (snapshot.is_err()) return R::Err(snapshot);
    if (!snapshot.value) return R::Ok(std::nullopt);

    auto stored = store_payload(snapshot.value->payload);
    if (stored.is_err()) return R::Err(stored);
    tracker_.mark_data_updated_from_server(snapshot.value->revision);
    return R::Ok(std::move(snapshot.value->payload));
}

// ── Remote writes ──────────────────────────────────────────

Result<MetadataV1> SyncEngine::write_payload(const std::string& payload, uint64_t revision,
                                             uint64_t previous_batches) {
    auto chunks = chunk_codec::split(payload, chunk_size_);

    MetadataV1 meta;
    meta.revision = revision;
    meta.batches = chunks.size();

    // Metadata first: a reader racing this write sees the new batch count
    // and treats not-yet-written chunks as missing.
    auto r = remote_.set(meta_key(), encode_metadata(meta));
    if (r.is_err()) return Result<MetadataV1>::Err(r);

    for (const auto& chunk : chunks) {
        if (chunk.index > 0 && config_.chunk_delay_ms > 0) {
            platform::sleep_ms(config_.chunk_delay_ms);
        }
        r = remote_.set(batch_key(chunk.index), chunk.content);
        if (r.is_err()) {
            return Result<MetadataV1>::Err(
                fmt::format("chunk {} of {}: {}", chunk.index, chunks.size(), r.error), r.kind);
        }
    }

    for (uint64_t i = chunks.size(); i < previous_batches; ++i) {
        r = remote_.remove(batch_key(i));
        if (r.is_err()) return Result<MetadataV1>::Err(r);
    }

    return Result<MetadataV1>::Ok(meta);
}

bool SyncEngine::begin_push() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (push_in_flight_) {
        cardsync_log("sync_engine: push already in flight");
        return false;
    }
    if (last_push_attempt_ &&
        now - *last_push_attempt_ < std::chrono::milliseconds(config_.throttle_ms)) {
        cardsync_log("sync_engine: push throttled");
        return false;
    }
    push_in_flight_ = true;
    last_push_attempt_ = now;
    return true;
}

void SyncEngine::end_push() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        push_in_flight_ = false;
    }
    idle_cv_.notify_all();
}

bool SyncEngine::push_to_remote() {
    if (!begin_push()) return false;

    struct InFlight {
        SyncEngine& engine;
        ~InFlight() { engine.end_push(); }
    } in_flight{*this};

    try {
        return run_push();
    } catch (const std::exception& e) {
        cardsync_log(fmt::format("sync_engine: push aborted: {}", e.what()));
        tracker_.mark_sync_failed(e.what());
        return false;
    }
}

bool SyncEngine::run_push() {
    tracker_.mark_as_syncing();

    auto entry = tracker_.state();
    if (entry.revision_server > entry.revision_local) {
        // Local is behind with nothing of its own to write: read instead
        auto pulled = pull_from_remote();
        if (pulled) {
            tracker_.mark_as_synced();
        } else {
            tracker_.mark_sync_failed("remote read failed");
        }
        return pulled.has_value();
    }

    if (!tracker_.needs_cloud_write()) {
        tracker_.mark_as_synced();
        return true;
    }

    auto meta = read_metadata();
    if (meta.is_ok() && meta.value && is_legacy(*meta.value)) {
        auto migrated = migrate_from(meta.value);
        if (migrated.is_err()) {
            tracker_.mark_sync_failed("migration failed: " + migrated.error);
            return false;
        }
        meta = read_metadata();
    }
    if (meta.is_err()) {
        tracker_.mark_sync_failed(meta.error);
        return false;
    }

    uint64_t previous_batches = 0;
    if (meta.value) {
        const auto& v1 = std::get<MetadataV1>(*meta.value);
        tracker_.set_server_revision(static_cast<int64_t>(v1.revision));
        previous_batches = v1.batches;
    }

    auto state = tracker_.state();
    if (state.revision_server > state.revision_local) {
        cardsync_log(fmt::format("sync_engine: conflict, server {} ahead of local {}; "
                                 "discarding local changes",
                                 state.revision_server, state.revision_local));
        tracker_.mark_sync_failed(CONFLICT_MESSAGE);
        return pull_from_remote().has_value();
    }

    // Revision is captured before the payload so a concurrent save can only
    // make the pushed payload newer than its label, never older.
    uint64_t revision = state.revision_local;
    auto payload = load_local();
    if (!payload) {
        tracker_.mark_sync_failed("no local data to push");
        return false;
    }

    auto written = write_payload(*payload, revision, previous_batches);
    if (written.is_err()) {
        // Metadata read back from an earlier partial write of this same
        // revision must not count as synced
        if (state.revision_server == revision) {
            tracker_.set_server_revision(static_cast<int64_t>(entry.revision_server));
        }
        tracker_.mark_sync_failed(written.error);
        return false;
    }

    tracker_.mark_as_synced(revision);
    cardsync_log(fmt::format("sync_engine: pushed revision {} in {} chunks",
                             revision, written.value.batches));
    return true;
}

// ── Migration ──────────────────────────────────────────────

Result<bool> SyncEngine::migrate_legacy() {
    auto meta = read_metadata();
    if (meta.is_err()) return Result<bool>::Err(meta);
    return migrate_from(meta.value);
}

Result<bool> SyncEngine::migrate_from(const std::optional<RemoteMetadata>& meta) {
    if (meta && !is_legacy(*meta)) {
        return Result<bool>::Ok(false);
    }

    std::string payload;
    std::vector<std::string> legacy_keys;

    if (meta) {
        uint64_t count = std::get<MetadataV0>(*meta).legacy_batch_count;
        cardsync_log(fmt::format("sync_engine: migrating {} legacy chunks", count));

        std::vector<Chunk> chunks;
        for (size_t i = 0; i < count; ++i) {
            auto raw = remote_.get(legacy_batch_key(i));
            if (raw.is_err()) return Result<bool>::Err(raw);
            if (!raw.value) {
                return Result<bool>::Err(fmt::format("missing legacy chunk {} of {}", i, count),
                                         ErrorKind::Corruption);
            }
            auto content = decode_legacy_chunk(*raw.value);
            if (content.is_err()) return Result<bool>::Err(content);
            chunks.push_back({i, std::move(content.value)});
            legacy_keys.push_back(legacy_batch_key(i));
        }

        auto joined = chunk_codec::join(std::move(chunks), count);
        if (joined.is_err()) return Result<bool>::Err(joined);
        payload = std::move(joined.value);
    } else {
        // Oldest layout: small payloads stored unchunked under the base key
        auto single = remote_.get(base_key_);
        if (single.is_err()) return Result<bool>::Err(single);
        if (!single.value) return Result<bool>::Ok(false);
        cardsync_log("sync_engine: migrating single-key legacy payload");
        payload = std::move(*single.value);
        legacy_keys.push_back(base_key_);
    }

    auto written = write_payload(payload, 1, 0);
    if (written.is_err()) return Result<bool>::Err(written);

    for (const auto& key : legacy_keys) {
        auto r = remote_.remove(key);
        if (r.is_err()) {
            cardsync_log("sync_engine: could not remove legacy key " + key + ": " + r.error);
        }
    }

    tracker_.set_server_revision(1);
    cardsync_log(fmt::format("sync_engine: migration complete ({} chars, {} chunks)",
                             payload.size(), written.value.batches));
    return Result<bool>::Ok(true);
}

// ── Background worker ──────────────────────────────────────

void SyncEngine::request_push() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        push_requested_ = true;
    }
    worker_cv_.notify_one();
}

void SyncEngine::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        bool periodic = periodic_enabled_;
        auto wake = [this, periodic] {
            return stopping_ || push_requested_ || periodic_enabled_ != periodic;
        };
        if (periodic) {
            worker_cv_.wait_until(lock, next_tick_, wake);
        } else {
            worker_cv_.wait(lock, wake);
        }
        if (stopping_) break;

        bool requested = push_requested_;
        bool tick = false;
        if (!requested && periodic_enabled_ && Clock::now() >= next_tick_) {
            tick = true;
            next_tick_ = Clock::now() + std::chrono::milliseconds(config_.interval_ms);
        }
        if (!requested && !tick) continue;

        push_requested_ = false;
        worker_busy_ = true;
        bool in_flight = push_in_flight_;
        lock.unlock();

        try {
            if (requested) {
                push_to_remote();
            } else if (!in_flight && tracker_.needs_cloud_write()) {
                cardsync_log("sync_engine: periodic push");
                push_to_remote();
            }
        } catch (const std::exception& e) {
            cardsync_log(fmt::format("sync_engine: background sync failed: {}", e.what()));
            tracker_.mark_sync_failed(e.what());
        }

        lock.lock();
        worker_busy_ = false;
        idle_cv_.notify_all();
    }
}

void SyncEngine::start_periodic_sync() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (periodic_enabled_) return;
        periodic_enabled_ = true;
        next_tick_ = Clock::now() + std::chrono::milliseconds(config_.interval_ms);
    }
    cardsync_log(fmt::format("sync_engine: periodic sync every {}ms", config_.interval_ms));
    worker_cv_.notify_one();
}

void SyncEngine::stop_periodic_sync() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!periodic_enabled_) return;
        periodic_enabled_ = false;
    }
    cardsync_log("sync_engine: periodic sync stopped");
    worker_cv_.notify_one();
}

bool SyncEngine::periodic_sync_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return periodic_enabled_;
}

bool SyncEngine::flush(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
        return !push_requested_ && !worker_busy_ && !push_in_flight_;
    });
}

std::chrono::milliseconds SyncEngine::throttle_remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_push_attempt_) return std::chrono::milliseconds(0);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - *last_push_attempt_);
    auto remaining = std::chrono::milliseconds(config_.throttle_ms) - elapsed;
    return remaining.count() > 0 ? remaining : std::chrono::milliseconds(0);
}

bool SyncEngine::sync_now(int timeout_ms) {
    if (!flush(timeout_ms)) return false;
    auto wait = throttle_remaining();
    if (wait.count() > 0) {
        platform::sleep_ms(static_cast<int>(wait.count()) + 1);
    }
    return push_to_remote();
}

// ── Reset ──────────────────────────────────────────────────

Result<void> SyncEngine::reset(bool clear_remote) {
    if (!flush()) {
        return Result<void>::Err("timed out waiting for in-flight push", ErrorKind::Timeout);
    }
    tracker_.reset();

    for (const auto& key : {data_key(), data_timestamp_key()}) {
        auto r = local_.remove(key);
        if (r.is_err()) return r;
    }

    if (clear_remote) {
        auto cleared = remote_.clear();
        if (cleared.is_err()) return Result<void>::Err(cleared);
        cardsync_log(fmt::format("sync_engine: cleared {} remote keys", cleared.value));
    }
    return Result<void>::Ok();
}
