#include "sealdrop/file_stream.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace sealdrop::filestream {

Bytes ByteSource::Slice(std::uint64_t offset, std::size_t len) const {
    Bytes out(len);
    std::size_t filled = 0;
    while (filled < len) {
        std::size_t n = ReadAt(offset + filled, out.data() + filled, len - filled);
        if (n == 0) {
            throw std::runtime_error("Byte source ended before offset " + std::to_string(offset + len));
        }
        filled += n;
    }
    return out;
}

MemoryByteSource::MemoryByteSource(std::shared_ptr<const Bytes> data) : data_(std::move(data)) {
    if (!data_) {
        throw std::invalid_argument("MemoryByteSource needs data");
    }
}

MemoryByteSource::MemoryByteSource(Bytes data)
    : data_(std::make_shared<const Bytes>(std::move(data))) {}

std::size_t MemoryByteSource::ReadAt(std::uint64_t offset, std::uint8_t* out, std::size_t len) const {
    if (offset >= data_->size()) {
        return 0;
    }
    std::size_t available = static_cast<std::size_t>(data_->size() - offset);
    std::size_t n = std::min(len, available);
    std::copy_n(data_->begin() + static_cast<std::ptrdiff_t>(offset), n, out);
    return n;
}

FileByteSource::FileByteSource(const std::filesystem::path& path)
    : path_(path), input_(path, std::ios::binary) {
    if (!input_) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    input_.seekg(0, std::ios::end);
    size_ = static_cast<std::uint64_t>(input_.tellg());
    input_.seekg(0, std::ios::beg);
}

std::size_t FileByteSource::ReadAt(std::uint64_t offset, std::uint8_t* out, std::size_t len) const {
    if (offset >= size_) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    input_.clear();
    input_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    input_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(len));
    std::size_t n = static_cast<std::size_t>(input_.gcount());
    if (n == 0 && input_.bad()) {
        throw std::runtime_error("Failed to read from file: " + path_.string());
    }
    return n;
}

Bytes ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    input.seekg(0, std::ios::beg);
    Bytes data(static_cast<std::size_t>(size));
    if (size > 0) {
        input.read(reinterpret_cast<char*>(data.data()), size);
        if (input.gcount() != size) {
            throw std::runtime_error("Failed to read file: " + path.string());
        }
    }
    return data;
}

void WriteFileAtomic(const std::filesystem::path& path, const std::uint8_t* data, std::size_t len) {
    std::filesystem::path temp = path;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Failed to open output file: " + temp.string());
        }
        if (len > 0) {
            output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        }
        output.flush();
        if (!output) {
            throw std::runtime_error("Failed to write file: " + temp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(temp, ec);
        throw std::runtime_error("Failed to replace file " + path.string() + ": " + reason);
    }
}

void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data) {
    WriteFileAtomic(path, data.data(), data.size());
}

}  // namespace sealdrop::filestream
