#include "sealdrop/chunking.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace sealdrop::transfer {

std::uint32_t ChunkCount(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    std::uint64_t count = file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("Chunk size too small for file size");
    }
    return static_cast<std::uint32_t>(count);
}

std::vector<Chunk> CalculateChunks(std::uint64_t file_size, std::uint64_t chunk_size) {
    const std::uint32_t count = ChunkCount(file_size, chunk_size);
    std::vector<Chunk> chunks;
    chunks.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        Chunk chunk;
        chunk.index = i;
        chunk.start = static_cast<std::uint64_t>(i) * chunk_size;
        chunk.end = std::min(chunk.start + chunk_size, file_size);
        chunks.push_back(chunk);
    }
    return chunks;
}

std::string MakeFileId(const std::string& name, std::uint64_t size, std::int64_t last_modified_ms) {
    return name + "_" + std::to_string(size) + "_" + std::to_string(last_modified_ms);
}

}  // namespace sealdrop::transfer
