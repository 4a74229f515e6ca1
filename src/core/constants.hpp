#pragma once

#include <cstddef>
#include <cstdint>

// ── Timeouts ────────────────────────────────────────────────
constexpr int REMOTE_OP_TIMEOUT_MS       = 10000; // Max wait for a backend completion
constexpr int PUSH_THROTTLE_MS           = 5000;  // Min interval between push attempts
constexpr int PERIODIC_SYNC_MS           = 10000; // Background sync tick
constexpr int CHUNK_WRITE_DELAY_MS       = 100;   // Pause between chunk writes (rate limit)
constexpr int FLUSH_TIMEOUT_MS           = 30000; // Max wait for in-flight push at shutdown

// ── Sizes ───────────────────────────────────────────────────
constexpr size_t DEFAULT_MAX_CHUNK_SIZE  = 1500;  // Backend per-item limit (characters)
constexpr uint64_t MAX_REMOTE_BATCHES    = 100000; // Larger batch counts in metadata are corrupt

// ── Remote layout ───────────────────────────────────────────
constexpr int METADATA_VERSION           = 1;
constexpr const char* DEFAULT_BASE_KEY   = "cards";
constexpr const char* CONFLICT_MESSAGE   = "server has newer data";

// Key templates: fmt::format(KEY_META, base)
constexpr const char* KEY_META           = "{}_meta";
constexpr const char* KEY_BATCH          = "{}_batch_{}";
constexpr const char* KEY_LEGACY_BATCH   = "{}_cardsBatch{}";

// Local layout
constexpr const char* KEY_DATA           = "{}_data";
constexpr const char* KEY_DATA_TIMESTAMP = "{}_data_timestamp";
constexpr const char* KEY_REVISION       = "{}_revision";
constexpr const char* KEY_SERVER_REV     = "{}_server_revision";
constexpr const char* KEY_LAST_MODIFIED  = "{}_last_modified";
constexpr const char* KEY_LAST_SAVED     = "{}_last_saved";

// Seed deck written when neither side has any data
constexpr const char* DEFAULT_PAYLOAD =
    "question\tanswer\tdue\tstability\tdifficulty\telapsed_days\tscheduled_days\treps\tlapses\tstate\tlast_review\n"
    "Hello\tПривет\n"
    "World\tМир\n"
    "Cat\tКот";
