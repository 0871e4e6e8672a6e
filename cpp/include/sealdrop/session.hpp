#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sealdrop/chunking.hpp"
#include "sealdrop/file_stream.hpp"

namespace sealdrop::transfer {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class SessionStatus {
    kIdle,
    kChecking,
    kActive,
    kUploading,
    kPaused,
    kCompleted,
    kError,
    kCancelled,
};

const char* ToString(SessionStatus status);
// Throws std::invalid_argument for an unknown name.
SessionStatus StatusFromString(const std::string& name);
bool CanTransition(SessionStatus from, SessionStatus to);
// The only statuses that are ever written to the store.
bool IsPersistable(SessionStatus status);

struct TransferSession {
    std::string file_id;
    std::string session_id;
    std::string upload_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string content_type;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::vector<Chunk> chunks;
    std::set<std::uint32_t> completed_chunks;
    double progress = 0.0;
    SessionStatus status = SessionStatus::kIdle;
    TimePoint started_at{};
    TimePoint expires_at{};
    std::map<std::string, std::string> metadata;
    std::string last_error;

    // Throws std::logic_error on an illegal transition.
    void TransitionTo(SessionStatus next);
    // Marks the chunk, updates progress. Returns false if it was already done.
    bool MarkCompleted(std::uint32_t index);
    // Replaces the completed set, dropping indices outside the partition.
    void ResetCompleted(const std::set<std::uint32_t>& indices);
    void RecomputeProgress();
    std::uint64_t UploadedBytes() const;
    bool IsExpired(TimePoint now) const { return now >= expires_at; }
    bool AllChunksDone() const { return completed_chunks.size() == total_chunks; }
};

// The live handle to the bytes being uploaded. Never persisted.
struct FileHandle {
    std::string name;
    std::uint64_t size = 0;
    std::int64_t last_modified_ms = 0;
    std::string content_type;
    std::shared_ptr<filestream::ByteSource> source;

    std::string FileId() const { return MakeFileId(name, size, last_modified_ms); }
};

// Builds a handle over a file on disk using its name, size and mtime.
FileHandle OpenFileHandle(const std::filesystem::path& path, const std::string& content_type = {});

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.000Z.
std::string FormatTimestamp(TimePoint time);
std::optional<TimePoint> ParseTimestamp(const std::string& text);

}  // namespace sealdrop::transfer
