#include "sealdrop/session.hpp"

#include "sealdrop/constants.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

#include <sys/stat.h>

namespace sealdrop::transfer {

const char* ToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::kIdle: return "idle";
        case SessionStatus::kChecking: return "checking";
        case SessionStatus::kActive: return "active";
        case SessionStatus::kUploading: return "uploading";
        case SessionStatus::kPaused: return "paused";
        case SessionStatus::kCompleted: return "completed";
        case SessionStatus::kError: return "error";
        case SessionStatus::kCancelled: return "cancelled";
    }
    return "unknown";
}

SessionStatus StatusFromString(const std::string& name) {
    static const std::map<std::string, SessionStatus> kByName = {
        {"idle", SessionStatus::kIdle},
        {"checking", SessionStatus::kChecking},
        {"active", SessionStatus::kActive},
        {"uploading", SessionStatus::kUploading},
        {"paused", SessionStatus::kPaused},
        {"completed", SessionStatus::kCompleted},
        {"error", SessionStatus::kError},
        {"cancelled", SessionStatus::kCancelled},
    };
    auto it = kByName.find(name);
    if (it == kByName.end()) {
        throw std::invalid_argument("Unknown session status: " + name);
    }
    return it->second;
}

bool CanTransition(SessionStatus from, SessionStatus to) {
    using S = SessionStatus;
    if (from == S::kCompleted || from == S::kCancelled) {
        return false;
    }
    if (to == S::kCancelled) {
        return true;
    }
    switch (from) {
        case S::kIdle:
            return to == S::kChecking || to == S::kActive;
        case S::kChecking:
            return to == S::kIdle || to == S::kActive;
        case S::kActive:
            return to == S::kUploading || to == S::kPaused || to == S::kError;
        case S::kUploading:
            // A session left uploading by a crash is picked up again as is.
            return to == S::kUploading || to == S::kPaused || to == S::kCompleted || to == S::kError;
        case S::kPaused:
            return to == S::kPaused || to == S::kUploading || to == S::kError;
        case S::kError:
            return to == S::kUploading || to == S::kError;
        default:
            return false;
    }
}

bool IsPersistable(SessionStatus status) {
    switch (status) {
        case SessionStatus::kActive:
        case SessionStatus::kUploading:
        case SessionStatus::kPaused:
        case SessionStatus::kCompleted:
        case SessionStatus::kError:
            return true;
        default:
            return false;
    }
}

void TransferSession::TransitionTo(SessionStatus next) {
    if (!CanTransition(status, next)) {
        throw std::logic_error(std::string("Illegal session transition ") + ToString(status) + " -> " +
                               ToString(next));
    }
    status = next;
}

bool TransferSession::MarkCompleted(std::uint32_t index) {
    if (index >= total_chunks) {
        throw std::out_of_range("Chunk index " + std::to_string(index) + " outside partition");
    }
    bool inserted = completed_chunks.insert(index).second;
    if (index < chunks.size()) {
        chunks[index].uploaded = true;
    }
    RecomputeProgress();
    return inserted;
}

void TransferSession::ResetCompleted(const std::set<std::uint32_t>& indices) {
    completed_chunks.clear();
    for (Chunk& chunk : chunks) {
        chunk.uploaded = false;
    }
    for (std::uint32_t index : indices) {
        if (index >= total_chunks) {
            continue;
        }
        completed_chunks.insert(index);
        if (index < chunks.size()) {
            chunks[index].uploaded = true;
        }
    }
    RecomputeProgress();
}

void TransferSession::RecomputeProgress() {
    if (total_chunks == 0) {
        progress = 0.0;
        return;
    }
    progress = static_cast<double>(completed_chunks.size()) / static_cast<double>(total_chunks) * 100.0;
}

std::uint64_t TransferSession::UploadedBytes() const {
    std::uint64_t total = 0;
    for (std::uint32_t index : completed_chunks) {
        if (index < chunks.size()) {
            total += chunks[index].Size();
        }
    }
    return total;
}

FileHandle OpenFileHandle(const std::filesystem::path& path, const std::string& content_type) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        throw std::runtime_error("Failed to stat file: " + path.string());
    }
    FileHandle handle;
    handle.name = path.filename().string();
    handle.source = std::make_shared<filestream::FileByteSource>(path);
    handle.size = handle.source->Size();
    handle.last_modified_ms = static_cast<std::int64_t>(info.st_mtim.tv_sec) * 1000 +
                              static_cast<std::int64_t>(info.st_mtim.tv_nsec / 1000000);
    handle.content_type = content_type.empty() ? std::string(constants::kDefaultContentType) : content_type;
    return handle;
}

std::string FormatTimestamp(TimePoint time) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    int fraction = static_cast<int>(millis % 1000);
    if (fraction < 0) {
        fraction += 1000;
        --seconds;
    }
    std::tm parts {};
    gmtime_r(&seconds, &parts);
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", parts.tm_year + 1900,
                  parts.tm_mon + 1, parts.tm_mday, parts.tm_hour, parts.tm_min, parts.tm_sec, fraction);
    return buffer;
}

std::optional<TimePoint> ParseTimestamp(const std::string& text) {
    std::tm parts {};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &parts.tm_year, &parts.tm_mon, &parts.tm_mday,
                    &parts.tm_hour, &parts.tm_min, &parts.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    std::size_t pos = static_cast<std::size_t>(consumed);
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    if (parts.tm_mon < 1 || parts.tm_mon > 12 || parts.tm_mday < 1 || parts.tm_mday > 31) {
        return std::nullopt;
    }
    parts.tm_year -= 1900;
    parts.tm_mon -= 1;
    std::time_t seconds = timegm(&parts);
    return Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

}  // namespace sealdrop::transfer
