#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <core/types.hpp>

struct Chunk {
    size_t index = 0;
    std::string content;
};

// Fixed-size slicing of a payload into backend-sized chunks.
//
// An empty payload yields zero chunks; on the remote it is recorded as a
// metadata record with `batches == 0` and no chunk keys.
namespace chunk_codec {

// Split `payload` into chunks of at most max_chunk_size bytes, indexed from 0.
// Cuts fall on UTF-8 character boundaries so each chunk is valid text on its
// own; only a limit smaller than one character forces a cut inside it.
// Throws std::invalid_argument if max_chunk_size is 0.
std::vector<Chunk> split(const std::string& payload, size_t max_chunk_size);

// Concatenate chunks 0..batch_count-1. Input may be in any order.
// Fails with ErrorKind::Corruption if an index is missing, repeated or out of range.
Result<std::string> join(std::vector<Chunk> chunks, size_t batch_count);

} // namespace chunk_codec
