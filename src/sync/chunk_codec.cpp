#include "chunk_codec.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace chunk_codec {

static bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::vector<Chunk> split(const std::string& payload, size_t max_chunk_size) {
    if (max_chunk_size == 0) {
        throw std::invalid_argument("chunk size must be at least 1");
    }

    std::vector<Chunk> chunks;
    size_t offset = 0;
    while (offset < payload.size()) {
        size_t end = std::min(payload.size(), offset + max_chunk_size);
        // Back off so the next chunk starts on a UTF-8 lead byte. A chunk too
        // small for one whole character is cut at the byte limit.
        size_t cut = end;
        while (cut > offset && cut < payload.size() && is_continuation(payload[cut])) {
            --cut;
        }
        if (cut > offset) end = cut;

        chunks.push_back({chunks.size(), payload.substr(offset, end - offset)});
        offset = end;
    }
    return chunks;
}

Result<std::string> join(std::vector<Chunk> chunks, size_t batch_count) {
    std::sort(chunks.begin(), chunks.end(),
              [](const Chunk& a, const Chunk& b) { return a.index < b.index; });

    size_t total = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index >= batch_count) {
            return Result<std::string>::Err(
                fmt::format("chunk {} outside batch count {}", chunks[i].index, batch_count),
                ErrorKind::Corruption);
        }
        if (chunks[i].index != i) {
            // Sorted and in range: a gap or duplicate shows up as index != position
            size_t missing = chunks[i].index > i ? i : chunks[i].index;
            return Result<std::string>::Err(
                fmt::format("missing or duplicate chunk {} of {}", missing, batch_count),
                ErrorKind::Corruption);
        }
        total += chunks[i].content.size();
    }
    if (chunks.size() != batch_count) {
        return Result<std::string>::Err(
            fmt::format("missing chunk {} of {}", chunks.size(), batch_count),
            ErrorKind::Corruption);
    }

    std::string payload;
    payload.reserve(total);
    for (const auto& c : chunks) {
        payload += c.content;
    }
    return Result<std::string>::Ok(std::move(payload));
}

} // namespace chunk_codec
