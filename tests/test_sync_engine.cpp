#include <gtest/gtest.h>
#include <sync/sync_context.hpp>
#include <sync/remote_metadata.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <chrono>
#include <memory>
#include <thread>
#include "fake_backend.hpp"
#include "test_helpers.hpp"

class SyncEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<SyncContext> ctx_;
    FakeBackend* fake_ = nullptr;

    void open(const Config& config, bool available = true) {
        auto backend = std::make_unique<FakeBackend>(1500, available);
        fake_ = backend.get();
        ctx_ = std::make_unique<SyncContext>(config, std::move(backend));
    }

    void open(int throttle_ms = 0) {
        open(make_test_config(throttle_ms));
    }

    SyncEngine& engine() { return ctx_->engine(); }
    RevisionTracker& tracker() { return ctx_->tracker(); }

    // Seed the fake remote with a current-layout payload
    void put_remote(const std::string& payload, uint64_t revision) {
        MetadataV1 meta;
        meta.revision = revision;
        meta.batches = (payload.size() + 1499) / 1500;
        fake_->put("cards_meta", encode_metadata(meta));
        for (size_t i = 0; i < meta.batches; ++i) {
            fake_->put("cards_batch_" + std::to_string(i), payload.substr(i * 1500, 1500));
        }
    }

    MetadataV1 remote_meta() {
        auto raw = fake_->peek("cards_meta");
        EXPECT_TRUE(raw.has_value());
        auto decoded = decode_metadata(raw.value_or(""));
        EXPECT_TRUE(decoded.is_ok()) << decoded.error;
        if (decoded.is_err() || is_legacy(decoded.value)) return MetadataV1{};
        return std::get<MetadataV1>(decoded.value);
    }
};

// ── Push ────────────────────────────────────────────────────

TEST_F(SyncEngineTest, SaveSplitsIntoChunks) {
    open();
    std::string payload(5000, 'A');
    engine().save_locally(payload);
    ASSERT_TRUE(engine().flush());

    auto meta = remote_meta();
    EXPECT_EQ(meta.version, 1);
    EXPECT_EQ(meta.revision, 1u);
    EXPECT_EQ(meta.batches, 4u);
    EXPECT_EQ(fake_->peek("cards_batch_0").value_or("").size(), 1500u);
    EXPECT_EQ(fake_->peek("cards_batch_3").value_or("").size(), 500u);
    EXPECT_FALSE(fake_->has("cards_batch_4"));

    auto s = engine().sync_status();
    EXPECT_EQ(s.revision_local, 1u);
    EXPECT_EQ(s.revision_server, 1u);
    EXPECT_FALSE(s.has_unsaved_changes);
    EXPECT_FALSE(s.is_syncing);
    EXPECT_TRUE(s.last_saved.has_value());
}

TEST_F(SyncEngineTest, PulledPayloadMatchesPushed) {
    open();
    std::string payload(5000, 'A');
    put_remote(payload, 1);

    auto pulled = engine().pull_from_remote();
    ASSERT_TRUE(pulled.has_value());
    EXPECT_EQ(*pulled, payload);
    EXPECT_EQ(engine().load_local().value_or(""), payload);
    EXPECT_EQ(tracker().state().revision_local, 1u);
    EXPECT_EQ(tracker().state().revision_server, 1u);
}

TEST_F(SyncEngineTest, ShrinkingPayloadRemovesTrailingChunks) {
    open();
    engine().save_locally(std::string(5000, 'A'));
    ASSERT_TRUE(engine().flush());
    ASSERT_TRUE(fake_->has("cards_batch_3"));

    engine().save_locally("short");
    ASSERT_TRUE(engine().flush());

    auto meta = remote_meta();
    EXPECT_EQ(meta.revision, 2u);
    EXPECT_EQ(meta.batches, 1u);
    EXPECT_EQ(fake_->peek("cards_batch_0").value_or(""), "short");
    EXPECT_FALSE(fake_->has("cards_batch_1"));
    EXPECT_FALSE(fake_->has("cards_batch_2"));
    EXPECT_FALSE(fake_->has("cards_batch_3"));
}

TEST_F(SyncEngineTest, ThrottleBlocksSecondPush) {
    open(5000);
    engine().save_locally("first");
    ASSERT_TRUE(engine().flush());
    ASSERT_EQ(remote_meta().revision, 1u);
    size_t ops = fake_->op_count();

    engine().save_locally("second");
    ASSERT_TRUE(engine().flush());
    EXPECT_FALSE(engine().push_to_remote());

    EXPECT_EQ(fake_->op_count(), ops);
    EXPECT_TRUE(tracker().state().has_unsaved_changes);
    EXPECT_GT(engine().throttle_remaining().count(), 0);
}

TEST_F(SyncEngineTest, SyncNowWaitsOutThrottle) {
    open(200);
    engine().save_locally("first");
    ASSERT_TRUE(engine().flush());

    engine().save_locally("second");
    ASSERT_TRUE(engine().flush());
    ASSERT_TRUE(tracker().state().has_unsaved_changes);

    EXPECT_TRUE(engine().sync_now());
    EXPECT_EQ(remote_meta().revision, 2u);
    EXPECT_EQ(fake_->peek("cards_batch_0").value_or(""), "second");
    EXPECT_FALSE(tracker().state().has_unsaved_changes);
}

TEST_F(SyncEngineTest, NothingToWriteSucceedsWithoutWrites) {
    open();
    EXPECT_TRUE(engine().push_to_remote());
    EXPECT_EQ(fake_->set_count(), 0u);
    EXPECT_FALSE(tracker().state().is_syncing);
}

TEST_F(SyncEngineTest, ServerAheadAtEntryReadsInstead) {
    open();
    put_remote("remote deck", 5);
    ASSERT_TRUE(ctx_->local().set("cards_data", "local deck").is_ok());
    tracker().set_local_revision(3);
    tracker().set_server_revision(5);

    EXPECT_TRUE(engine().push_to_remote());
    EXPECT_EQ(fake_->set_count(), 0u);
    EXPECT_EQ(engine().load_local().value_or(""), "remote deck");
    EXPECT_EQ(tracker().state().revision_local, 5u);
    EXPECT_FALSE(tracker().state().last_sync_error.has_value());
}

TEST_F(SyncEngineTest, ConflictDiscardsLocalChanges) {
    open();
    put_remote("other device", 5);
    ASSERT_TRUE(ctx_->local().set("cards_data", "mine").is_ok());
    tracker().set_server_revision(2);
    tracker().set_local_revision(3);

    engine().push_to_remote();

    auto s = tracker().state();
    EXPECT_EQ(s.last_sync_error.value_or(""), CONFLICT_MESSAGE);
    EXPECT_EQ(s.revision_local, 5u);
    EXPECT_EQ(s.revision_server, 5u);
    EXPECT_FALSE(s.has_unsaved_changes);
    EXPECT_EQ(engine().load_local().value_or(""), "other device");
    EXPECT_EQ(fake_->set_count(), 0u);
}

TEST_F(SyncEngineTest, ChunkWriteFailureKeepsChangesPending) {
    open();
    fake_->fail_sets_after(2);
    engine().save_locally(std::string(3000, 'B'));
    ASSERT_TRUE(engine().flush());

    auto failed = tracker().state();
    EXPECT_TRUE(failed.has_unsaved_changes);
    EXPECT_TRUE(failed.last_sync_error.has_value());
    EXPECT_FALSE(failed.is_syncing);
    EXPECT_EQ(failed.revision_server, 0u);

    // Retry fails again after reading back the partial write's metadata
    fake_->clear_failures();
    fake_->fail_key("cards_batch_1");
    EXPECT_FALSE(engine().sync_now());
    EXPECT_TRUE(tracker().state().has_unsaved_changes);
    EXPECT_EQ(tracker().state().revision_server, 0u);

    fake_->clear_failures();
    EXPECT_TRUE(engine().sync_now());
    EXPECT_FALSE(tracker().state().has_unsaved_changes);
    EXPECT_FALSE(tracker().state().last_sync_error.has_value());
    EXPECT_EQ(fake_->peek("cards_batch_1").value_or(""), std::string(1500, 'B'));
}

TEST_F(SyncEngineTest, EmptyPayloadStoresZeroBatches) {
    open();
    engine().save_locally("");
    ASSERT_TRUE(engine().flush());

    auto meta = remote_meta();
    EXPECT_EQ(meta.revision, 1u);
    EXPECT_EQ(meta.batches, 0u);

    auto pulled = engine().force_pull();
    ASSERT_TRUE(pulled.is_ok()) << pulled.error;
    ASSERT_TRUE(pulled.value.has_value());
    EXPECT_EQ(*pulled.value, "");
}

TEST_F(SyncEngineTest, HungRemoteRecordsTimeout) {
    Config config = make_test_config();
    config.remote().timeout_ms = 50;
    open(config);
    fake_->hold_completions(true);

    engine().save_locally("payload");
    ASSERT_TRUE(engine().flush());
    auto s = tracker().state();
    EXPECT_TRUE(s.has_unsaved_changes);
    EXPECT_TRUE(s.last_sync_error.has_value());

    fake_->hold_completions(false);
    fake_->release_held();
}

// ── Pull ────────────────────────────────────────────────────

TEST_F(SyncEngineTest, MissingChunkLeavesLocalUntouched) {
    open();
    ASSERT_TRUE(ctx_->local().set("cards_data", "keep me").is_ok());
    put_remote(std::string(3000, 'C'), 2);
    fake_->erase("cards_batch_1");

    EXPECT_FALSE(engine().pull_from_remote().has_value());
    EXPECT_EQ(engine().load_local().value_or(""), "keep me");
    EXPECT_EQ(tracker().state().revision_local, 0u);

    auto forced = engine().force_pull();
    ASSERT_TRUE(forced.is_err());
    EXPECT_EQ(forced.kind, ErrorKind::Corruption);
}

TEST_F(SyncEngineTest, PullWithoutRemoteData) {
    open();
    EXPECT_FALSE(engine().pull_from_remote().has_value());

    auto forced = engine().force_pull();
    ASSERT_TRUE(forced.is_ok());
    EXPECT_FALSE(forced.value.has_value());
}

TEST_F(SyncEngineTest, MalformedMetadataIsCorruption) {
    open();
    fake_->put("cards_meta", "{broken");
    auto forced = engine().force_pull();
    ASSERT_TRUE(forced.is_err());
    EXPECT_EQ(forced.kind, ErrorKind::Corruption);
}

// ── Startup ─────────────────────────────────────────────────

TEST_F(SyncEngineTest, InitializeSeedsDefaultWhenEmpty) {
    open();
    EXPECT_EQ(engine().initialize(), DEFAULT_PAYLOAD);
    EXPECT_TRUE(engine().periodic_sync_running());
    ASSERT_TRUE(engine().flush());

    EXPECT_EQ(engine().load_local().value_or(""), DEFAULT_PAYLOAD);
    EXPECT_EQ(remote_meta().revision, 1u);
}

TEST_F(SyncEngineTest, InitializePullsWhenLocalEmpty) {
    open();
    put_remote("remote deck", 4);

    EXPECT_EQ(engine().initialize(), "remote deck");
    EXPECT_EQ(tracker().state().revision_local, 4u);
    EXPECT_EQ(engine().load_local().value_or(""), "remote deck");
}

TEST_F(SyncEngineTest, InitializePullsWhenServerNewer) {
    open();
    put_remote("remote deck", 4);
    ASSERT_TRUE(ctx_->local().set("cards_data", "stale").is_ok());
    tracker().set_local_revision(2);
    tracker().set_server_revision(2);

    EXPECT_EQ(engine().initialize(), "remote deck");
    EXPECT_EQ(tracker().state().revision_local, 4u);
}

TEST_F(SyncEngineTest, InitializeKeepsLocalWhenAhead) {
    open();
    put_remote("remote deck", 1);
    ASSERT_TRUE(ctx_->local().set("cards_data", "edited offline").is_ok());
    tracker().set_local_revision(3);
    tracker().set_server_revision(1);

    EXPECT_EQ(engine().initialize(), "edited offline");
    EXPECT_TRUE(tracker().state().has_unsaved_changes);
    EXPECT_EQ(fake_->peek("cards_batch_0").value_or(""), "remote deck");
}

TEST_F(SyncEngineTest, InitializeFallsBackToLocalWhenRemoteBroken) {
    open();
    ASSERT_TRUE(ctx_->local().set("cards_data", "local copy").is_ok());
    tracker().set_local_revision(1);
    tracker().set_server_revision(1);
    fake_->fail_key("cards_meta");

    EXPECT_EQ(engine().initialize(), "local copy");
}

// ── Background sync ─────────────────────────────────────────

TEST_F(SyncEngineTest, PeriodicSyncPushesPendingChanges) {
    Config config = make_test_config();
    config.sync().interval_ms = 50;
    open(config);

    ASSERT_TRUE(ctx_->local().set("cards_data", "offline edit").is_ok());
    tracker().set_local_revision(1);
    engine().start_periodic_sync();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (tracker().state().has_unsaved_changes && std::chrono::steady_clock::now() < deadline) {
        platform::sleep_ms(20);
    }
    EXPECT_FALSE(tracker().state().has_unsaved_changes);
    EXPECT_EQ(fake_->peek("cards_batch_0").value_or(""), "offline edit");
}

TEST_F(SyncEngineTest, PeriodicSyncStartStopIdempotent) {
    open();
    EXPECT_FALSE(engine().periodic_sync_running());
    engine().start_periodic_sync();
    engine().start_periodic_sync();
    EXPECT_TRUE(engine().periodic_sync_running());
    engine().stop_periodic_sync();
    engine().stop_periodic_sync();
    EXPECT_FALSE(engine().periodic_sync_running());
}

TEST_F(SyncEngineTest, SubscribersSeeSyncProgress) {
    open();
    std::vector<bool> syncing;
    auto unsubscribe = engine().subscribe([&](const RevisionState& s) {
        syncing.push_back(s.is_syncing);
    });
    syncing.clear();

    ASSERT_TRUE(ctx_->local().set("cards_data", "x").is_ok());
    tracker().set_local_revision(1);
    syncing.clear();
    ASSERT_TRUE(engine().push_to_remote());
    unsubscribe();

    ASSERT_FALSE(syncing.empty());
    EXPECT_TRUE(syncing.front());
    EXPECT_FALSE(syncing.back());
}

// ── Storage selection ───────────────────────────────────────

TEST_F(SyncEngineTest, UnavailableRemoteUsesFallback) {
    open(make_test_config(), false);
    EXPECT_TRUE(ctx_->remote().is_fallback());

    engine().save_locally("offline deck");
    ASSERT_TRUE(engine().flush());

    EXPECT_EQ(fake_->op_count(), 0u);
    EXPECT_FALSE(tracker().state().has_unsaved_changes);
    auto meta = ctx_->remote().get("cards_meta");
    ASSERT_TRUE(meta.is_ok());
    EXPECT_TRUE(meta.value.has_value());
}

TEST_F(SyncEngineTest, ChunkSizeBoundedByBackend) {
    Config config = make_test_config();
    config.remote().max_value_size = 100000;
    open(config);
    EXPECT_EQ(engine().chunk_size(), 1500u);
}

// ── Reset ───────────────────────────────────────────────────

TEST_F(SyncEngineTest, ResetClearsLocalAndRemote) {
    open();
    engine().save_locally("deck");
    ASSERT_TRUE(engine().flush());
    ASSERT_GT(fake_->size(), 0u);

    auto r = engine().reset(true);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(engine().load_local().has_value());
    EXPECT_EQ(tracker().state().revision_local, 0u);
    EXPECT_EQ(tracker().state().revision_server, 0u);
    EXPECT_EQ(fake_->size(), 0u);
}

TEST_F(SyncEngineTest, ResetKeepsRemoteWhenAsked) {
    open();
    engine().save_locally("deck");
    ASSERT_TRUE(engine().flush());

    ASSERT_TRUE(engine().reset(false).is_ok());
    EXPECT_FALSE(engine().load_local().has_value());
    EXPECT_TRUE(fake_->has("cards_meta"));
}

TEST_F(SyncEngineTest, CloseIsIdempotent) {
    open();
    engine().start_periodic_sync();
    ctx_->close();
    EXPECT_FALSE(engine().periodic_sync_running());
    ctx_->close();
}

// ── Corrupt remote metadata ─────────────────────────────────

TEST_F(SyncEngineTest, ImplausibleBatchCountIsNotFatal) {
    open();
    fake_->put("cards_meta", R"({"version":1,"revision":7,"batches":4000000000000000000})");
    ASSERT_TRUE(ctx_->local().set("cards_data", "local copy").is_ok());

    std::optional<std::string> pulled;
    EXPECT_NO_THROW(pulled = engine().pull_from_remote());
    EXPECT_FALSE(pulled.has_value());
    EXPECT_EQ(engine().load_local().value_or(""), "local copy");

    auto forced = engine().force_pull();
    ASSERT_TRUE(forced.is_err());
    EXPECT_EQ(forced.kind, ErrorKind::Corruption);

    std::string loaded;
    EXPECT_NO_THROW(loaded = engine().initialize());
    EXPECT_EQ(loaded, "local copy");
}

TEST_F(SyncEngineTest, BackgroundPushSurvivesCorruptMetadata) {
    open();
    fake_->put("cards_meta", R"({"version":1,"revision":7,"batches":4000000000000000000})");

    engine().save_locally("edit");
    ASSERT_TRUE(engine().flush());

    auto s = tracker().state();
    EXPECT_TRUE(s.has_unsaved_changes);
    EXPECT_TRUE(s.last_sync_error.has_value());
    EXPECT_FALSE(s.is_syncing);
}

// ── Shared file remote ──────────────────────────────────────

TEST_F(SyncEngineTest, MultibyteDeckRoundTripsThroughFileRemote) {
    fs::path dir = platform::temp_dir() / "cardsync_file_remote_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    Config config = make_test_config();
    config.remote().path = (dir / "remote.yaml").string();

    std::string payload = DEFAULT_PAYLOAD;
    while (payload.size() < 4000) payload += "\nCat\tКот";
    {
        auto writer = SyncContext::open(config);
        ASSERT_FALSE(writer->remote().is_fallback());
        writer->engine().save_locally(payload);
        ASSERT_TRUE(writer->engine().sync_now());
        EXPECT_FALSE(writer->tracker().state().has_unsaved_changes);
    }

    auto reader = SyncContext::open(config);
    auto pulled = reader->engine().force_pull();
    ASSERT_TRUE(pulled.is_ok()) << pulled.error;
    ASSERT_TRUE(pulled.value.has_value());
    EXPECT_EQ(*pulled.value, payload);

    reader.reset();
    fs::remove_all(dir);
}
