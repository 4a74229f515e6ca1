#pragma once

#include <string>
#include <variant>
#include <cstdint>
#include <core/types.hpp>

// Legacy layout: `{"cardsBatches": N}`, chunks under `{base}_cardsBatch{i}`
struct MetadataV0 {
    uint64_t legacy_batch_count = 0;
};

// Current layout: `{"version": 1, "revision": R, "batches": N}`,
// chunks under `{base}_batch_{i}`
struct MetadataV1 {
    int version = METADATA_VERSION;
    uint64_t revision = 0;
    uint64_t batches = 0;
};

using RemoteMetadata = std::variant<MetadataV0, MetadataV1>;

// Decode a metadata record. The presence of `revision` selects V1.
// Malformed JSON, missing fields or a batch count above MAX_REMOTE_BATCHES
// fail with ErrorKind::Corruption.
Result<RemoteMetadata> decode_metadata(const std::string& text);

std::string encode_metadata(const MetadataV1& meta);

// Legacy chunks were stored either raw or wrapped as `{"content": "..."}`.
Result<std::string> decode_legacy_chunk(const std::string& text);

inline bool is_legacy(const RemoteMetadata& meta) {
    return std::holds_alternative<MetadataV0>(meta);
}
