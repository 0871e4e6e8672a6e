#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sealdrop::transfer {

// Half-open byte range [start, end) of the envelope.
struct Chunk {
    std::uint32_t index = 0;
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    bool uploaded = false;
    std::uint32_t retry_count = 0;

    std::uint64_t Size() const noexcept { return end - start; }
};

std::uint32_t ChunkCount(std::uint64_t file_size, std::uint64_t chunk_size);
// Contiguous, non-overlapping, ascending. Only the last chunk may be short.
// An empty file yields no chunks.
std::vector<Chunk> CalculateChunks(std::uint64_t file_size, std::uint64_t chunk_size);

// name_size_lastModified, the key a resumable session is stored under.
std::string MakeFileId(const std::string& name, std::uint64_t size, std::int64_t last_modified_ms);

}  // namespace sealdrop::transfer
