#include "cardsync_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <sync/chunk_codec.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <iterator>

CardsyncCLI::CardsyncCLI(const fs::path& config_path) : config_path_(config_path) {}

bool CardsyncCLI::open_context() {
    auto config = Config::load(config_path_);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return false;
    }
    ctx_ = SyncContext::open(config.value);
    return true;
}

void CardsyncCLI::print_state(const RevisionState& state) const {
    std::cout << theme::kv("storage", ctx_->remote().storage_type());
    std::cout << theme::kv("local rev", std::to_string(state.revision_local));
    std::cout << theme::kv("server rev", std::to_string(state.revision_server));
    std::cout << theme::kv("unsaved", state.has_unsaved_changes ? theme::yellow("yes") : theme::green("no"));
    std::cout << theme::kv("last saved", format_age(state.last_saved.value_or("")));
    std::cout << theme::kv("last modified", format_age(state.last_modified.value_or("")));
    if (state.last_sync_error) {
        std::cout << theme::kv("last error", theme::red(*state.last_sync_error));
    }
}

// ── Commands ───────────────────────────────────────────────

int CardsyncCLI::run_init() {
    fs::path path = config_path_.empty() ? get_config_path() : config_path_;
    if (config_exists(path)) {
        std::cout << theme::info("Config already exists at " + path.string());
        return 0;
    }
    auto r = create_default_config(path);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Config at " + path.string());
    return 0;
}

int CardsyncCLI::run_status() {
    if (!open_context()) return 1;
    std::cout << theme::section("Sync status");
    print_state(ctx_->tracker().state());
    return 0;
}

int CardsyncCLI::run_show() {
    if (!open_context()) return 1;
    std::string payload = ctx_->engine().initialize();
    std::cout << payload << "\n";
    ctx_->close();
    return 0;
}

int CardsyncCLI::run_save(const std::string& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        std::cout << theme::fail("Cannot read " + file);
        return 1;
    }
    std::string payload((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    if (!open_context()) return 1;
    auto& engine = ctx_->engine();
    engine.initialize();
    engine.save_locally(payload);
    std::cout << theme::ok(fmt::format("Saved {} characters locally", payload.size()));

    if (ctx_->tracker().needs_cloud_write()) {
        std::cout << theme::step("Pushing...");
        engine.sync_now();
    }

    auto state = ctx_->tracker().state();
    ctx_->close();
    if (state.has_unsaved_changes) {
        std::cout << theme::info("Not synced yet: " + state.last_sync_error.value_or("pending"));
        return 0;
    }
    std::cout << theme::ok(fmt::format("Synced at revision {}", state.revision_server));
    return 0;
}

int CardsyncCLI::run_push() {
    if (!open_context()) return 1;
    bool pushed = ctx_->engine().sync_now();
    auto state = ctx_->tracker().state();
    ctx_->close();

    if (!pushed || state.last_sync_error) {
        std::cout << theme::fail("Push failed: " + state.last_sync_error.value_or("throttled"));
        return 1;
    }
    std::cout << theme::ok(fmt::format("Remote at revision {}", state.revision_server));
    return 0;
}

int CardsyncCLI::run_pull() {
    if (!open_context()) return 1;
    auto r = ctx_->engine().force_pull();
    if (r.is_err()) {
        std::cout << theme::fail(fmt::format("Pull failed ({}): {}", error_kind_name(r.kind), r.error));
        return 1;
    }
    if (!r.value) {
        std::cout << theme::info("Remote holds no data");
        return 0;
    }
    std::cout << theme::ok(fmt::format("Pulled {} characters at revision {}",
                                       r.value->size(), ctx_->tracker().state().revision_server));
    return 0;
}

int CardsyncCLI::run_migrate() {
    if (!open_context()) return 1;
    auto r = ctx_->engine().migrate_legacy();
    if (r.is_err()) {
        std::cout << theme::fail(fmt::format("Migration failed ({}): {}", error_kind_name(r.kind), r.error));
        return 1;
    }
    std::cout << (r.value ? theme::ok("Migrated legacy data to revision 1")
                          : theme::info("Nothing to migrate"));
    return 0;
}

int CardsyncCLI::run_reset() {
    if (!open_context()) return 1;
    auto r = ctx_->engine().reset(true);
    if (r.is_err()) {
        std::cout << theme::fail("Reset failed: " + r.error);
        return 1;
    }
    std::cout << theme::ok("Local revisions and remote data cleared");
    return 0;
}

// Round-trip a small and a large payload through the chunk protocol
// under a scratch base key, then remove it.
int CardsyncCLI::run_selftest() {
    auto config = Config::load(config_path_);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }
    Config scratch = config.value;
    scratch.storage().base_key = "cardsync_selftest";
    scratch.storage().local_path = "";
    scratch.sync().throttle_ms = 0;
    scratch.sync().chunk_delay_ms = 0;

    auto ctx = SyncContext::open(scratch);
    auto& engine = ctx->engine();
    std::cout << theme::section("Self-test (" + ctx->remote().storage_type() + ")");

    int failures = 0;
    const std::string small = "Hello, world!";
    const std::string large(10000, 'A');
    for (const auto& payload : {small, large}) {
        engine.save_locally(payload);
        if (!engine.sync_now()) {
            std::cout << theme::fail(fmt::format("push of {} chars failed: {}", payload.size(),
                                                 engine.sync_status().last_sync_error.value_or("?")));
            ++failures;
            continue;
        }
        auto back = engine.force_pull();
        if (back.is_err() || !back.value || *back.value != payload) {
            std::cout << theme::fail(fmt::format("round-trip of {} chars failed", payload.size()));
            ++failures;
            continue;
        }
        std::cout << theme::ok(fmt::format("{} chars in {} chunks", payload.size(),
                                           chunk_codec::split(payload, engine.chunk_size()).size()));
    }

    auto cleanup = engine.reset(false);
    if (cleanup.is_err()) {
        std::cout << theme::fail("cleanup failed: " + cleanup.error);
        ++failures;
    }
    auto keys = ctx->remote().keys();
    if (keys.is_err()) {
        ++failures;
    } else {
        for (const auto& key : keys.value) {
            if (key.rfind(scratch.storage().base_key, 0) != 0) continue;
            if (ctx->remote().remove(key).is_err()) ++failures;
        }
    }
    ctx->close();

    if (failures > 0) {
        std::cout << theme::fail(fmt::format("{} check(s) failed, see {}", failures, cardsync_log_path()));
        return 1;
    }
    std::cout << theme::ok("All checks passed");
    return 0;
}
