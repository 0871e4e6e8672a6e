#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace sealdrop::filestream {

using Bytes = std::vector<std::uint8_t>;

constexpr std::size_t kDefaultChunkSize = 65536;

// Random-access view of the bytes being uploaded. Implementations must allow
// concurrent ReadAt calls from several worker threads.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual std::uint64_t Size() const = 0;
    // Reads up to len bytes at offset into out; returns the count read.
    virtual std::size_t ReadAt(std::uint64_t offset, std::uint8_t* out, std::size_t len) const = 0;

    // Copies [offset, offset + len); throws if the source is shorter.
    Bytes Slice(std::uint64_t offset, std::size_t len) const;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::shared_ptr<const Bytes> data);
    explicit MemoryByteSource(Bytes data);

    std::uint64_t Size() const override { return data_->size(); }
    std::size_t ReadAt(std::uint64_t offset, std::uint8_t* out, std::size_t len) const override;

private:
    std::shared_ptr<const Bytes> data_;
};

class FileByteSource : public ByteSource {
public:
    explicit FileByteSource(const std::filesystem::path& path);

    std::uint64_t Size() const override { return size_; }
    std::size_t ReadAt(std::uint64_t offset, std::uint8_t* out, std::size_t len) const override;

private:
    std::filesystem::path path_;
    mutable std::ifstream input_;
    mutable std::mutex mutex_;
    std::uint64_t size_ = 0;
};

// Sequential reader with a fixed internal buffer.
template<std::size_t ChunkSize = kDefaultChunkSize>
class BufferedFileReader {
public:
    explicit BufferedFileReader(const std::filesystem::path& path)
        : path_(path), input_(path, std::ios::binary) {
        if (!input_) {
            throw std::runtime_error("Failed to open file for reading: " + path.string());
        }
        input_.seekg(0, std::ios::end);
        total_size_ = static_cast<std::uint64_t>(input_.tellg());
        input_.seekg(0, std::ios::beg);
    }

    std::size_t ReadChunk(std::uint8_t* buffer, std::size_t max_size) {
        if (!input_ || input_.eof()) {
            return 0;
        }
        input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_size));
        std::size_t bytes_read = static_cast<std::size_t>(input_.gcount());
        if (bytes_read == 0 && !input_.eof()) {
            throw std::runtime_error("Failed to read from file: " + path_.string());
        }
        bytes_read_ += bytes_read;
        return bytes_read;
    }

    std::pair<const std::uint8_t*, std::size_t> ReadChunk() {
        std::size_t n = ReadChunk(chunk_->data(), chunk_->size());
        return {chunk_->data(), n};
    }

    std::uint64_t TotalSize() const noexcept { return total_size_; }
    std::uint64_t BytesRead() const noexcept { return bytes_read_; }
    bool HasMore() const noexcept { return bytes_read_ < total_size_; }

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::unique_ptr<std::array<std::uint8_t, ChunkSize>> chunk_ = std::make_unique<std::array<std::uint8_t, ChunkSize>>();
    std::uint64_t total_size_ = 0;
    std::uint64_t bytes_read_ = 0;
};

Bytes ReadFile(const std::filesystem::path& path);
// Writes to a sibling temporary file and renames it over path.
void WriteFileAtomic(const std::filesystem::path& path, const std::uint8_t* data, std::size_t len);
void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data);

}  // namespace sealdrop::filestream
