#include "remote_metadata.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static bool is_count(const json& j) {
    return j.is_number_unsigned() || (j.is_number_integer() && j.get<int64_t>() >= 0);
}

Result<RemoteMetadata> decode_metadata(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Result<RemoteMetadata>::Err("metadata is not a JSON object", ErrorKind::Corruption);
    }

    if (j.contains("revision")) {
        if (!is_count(j["revision"])) {
            return Result<RemoteMetadata>::Err("metadata revision is not a count", ErrorKind::Corruption);
        }
        if (!j.contains("batches") || !is_count(j["batches"])) {
            return Result<RemoteMetadata>::Err("metadata batches missing", ErrorKind::Corruption);
        }
        if (j["batches"].get<uint64_t>() > MAX_REMOTE_BATCHES) {
            return Result<RemoteMetadata>::Err("metadata batch count out of range", ErrorKind::Corruption);
        }
        MetadataV1 meta;
        if (j.contains("version") && j["version"].is_number_integer()) {
            meta.version = j["version"].get<int>();
        }
        meta.revision = j["revision"].get<uint64_t>();
        meta.batches = j["batches"].get<uint64_t>();
        return Result<RemoteMetadata>::Ok(meta);
    }

    if (j.contains("cardsBatches") && is_count(j["cardsBatches"])) {
        if (j["cardsBatches"].get<uint64_t>() > MAX_REMOTE_BATCHES) {
            return Result<RemoteMetadata>::Err("legacy batch count out of range", ErrorKind::Corruption);
        }
        MetadataV0 meta;
        meta.legacy_batch_count = j["cardsBatches"].get<uint64_t>();
        return Result<RemoteMetadata>::Ok(meta);
    }

    return Result<RemoteMetadata>::Err("unrecognized metadata layout", ErrorKind::Corruption);
}

std::string encode_metadata(const MetadataV1& meta) {
    json j;
    j["version"] = meta.version;
    j["revision"] = meta.revision;
    j["batches"] = meta.batches;
    return j.dump();
}

Result<std::string> decode_legacy_chunk(const std::string& text) {
    if (text.empty() || text.front() != '{') {
        return Result<std::string>::Ok(text);
    }

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        // Raw content that happens to start with a brace
        return Result<std::string>::Ok(text);
    }
    if (!j.contains("content") || !j["content"].is_string()) {
        return Result<std::string>::Err("legacy chunk has no content", ErrorKind::Corruption);
    }
    return Result<std::string>::Ok(j["content"].get<std::string>());
}
