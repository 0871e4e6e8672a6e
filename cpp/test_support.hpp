#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "sealdrop/errors.hpp"
#include "sealdrop/file_stream.hpp"
#include "sealdrop/retry.hpp"
#include "sealdrop/session.hpp"
#include "sealdrop/upload_api.hpp"

namespace sealdrop::testing {

inline int g_failures = 0;

inline bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    ++g_failures;
    return false;
}

inline bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

template <typename E, typename Fn>
bool check_throws(Fn&& fn, const std::string& msg) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (const std::exception& e) {
        return fail(msg + " (threw something else: " + e.what() + ")");
    }
    return fail(msg + " (did not throw)");
}

inline int finish(const char* suite) {
    if (g_failures == 0) {
        std::cout << suite << ": all checks passed\n";
        return 0;
    }
    std::cerr << suite << ": " << g_failures << " check(s) failed\n";
    return 1;
}

// PBKDF2 cost for tests that exercise envelope handling rather than the KDF.
inline constexpr std::uint32_t kFastKdfIterations = 1000;

inline std::filesystem::path MakeTempDir(const std::string& tag) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("sealdrop_" + tag + "_" + std::to_string(rd()) + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir;
}

struct TempDir {
    std::filesystem::path path;
    explicit TempDir(const std::string& tag) : path(MakeTempDir(tag)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

inline std::uint8_t PatternByte(std::uint64_t offset) {
    return static_cast<std::uint8_t>((offset * 31u + 7u) & 0xFFu);
}

// Deterministic bytes of any size without allocating them.
class PatternSource : public filestream::ByteSource {
public:
    explicit PatternSource(std::uint64_t size) : size_(size) {}

    std::uint64_t Size() const override { return size_; }
    std::size_t ReadAt(std::uint64_t offset, std::uint8_t* out, std::size_t len) const override {
        if (offset >= size_) return 0;
        std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(len, size_ - offset));
        for (std::size_t i = 0; i < n; ++i) {
            out[i] = PatternByte(offset + i);
        }
        return n;
    }

private:
    std::uint64_t size_;
};

class ManualClock {
public:
    ManualClock() : now_(transfer::Clock::from_time_t(1714564800)) {}

    transfer::TimePoint now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }
    void Advance(std::chrono::hours hours) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += hours;
    }
    std::function<transfer::TimePoint()> fn() {
        return [this] { return now(); };
    }

private:
    mutable std::mutex mutex_;
    transfer::TimePoint now_;
};

class RecordingSleeper {
public:
    transfer::Sleeper fn() {
        return [this](std::chrono::milliseconds delay) {
            std::lock_guard<std::mutex> lock(mutex_);
            delays_.push_back(delay);
        };
    }
    std::vector<std::chrono::milliseconds> delays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::chrono::milliseconds> delays_;
};

// In-memory upload API with call counters.
class FakeUploadApi : public transfer::UploadSessionApi {
public:
    struct Session {
        std::string file_name;
        std::uint64_t file_size = 0;
        std::uint32_t total_chunks = 0;
        std::set<std::uint32_t> completed;
        std::map<std::uint32_t, std::string> etags;
        bool finished = false;
    };

    explicit FakeUploadApi(ManualClock& clock, std::uint64_t chunk_size) : clock_(clock), chunk_size_(chunk_size) {}

    transfer::InitiateResponse Initiate(const transfer::InitiateRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++initiate_calls;
        if (fail_initiate) {
            throw ApiError(503, "service unavailable");
        }
        transfer::InitiateResponse response;
        response.session_id = "sess-" + std::to_string(++counter_);
        response.upload_id = "up-" + std::to_string(counter_);
        response.chunk_size = chunk_size_;
        response.total_chunks = static_cast<std::uint32_t>((request.file_size + chunk_size_ - 1) / chunk_size_);
        if (total_chunks_override >= 0) {
            response.total_chunks = static_cast<std::uint32_t>(total_chunks_override);
        }
        response.expires_at = clock_.now() + std::chrono::hours(24 * 7);
        Session session;
        session.file_name = request.file_name;
        session.file_size = request.file_size;
        session.total_chunks = response.total_chunks;
        sessions[response.session_id] = session;
        last_request = request;
        return response;
    }

    transfer::UploadUrl GetUploadUrl(const std::string& session_id, std::uint32_t chunk_index) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++get_url_calls;
            auto it = sessions.find(session_id);
            if (it == sessions.end() || it->second.finished) {
                throw SessionExpired(session_id);
            }
            if (it->second.completed.count(chunk_index) != 0) {
                transfer::UploadUrl done;
                done.already_uploaded = true;
                return done;
            }
        }
        if (on_get_url) {
            on_get_url(chunk_index);
        }
        transfer::UploadUrl url;
        url.url = "fake://" + session_id + "/" + std::to_string(chunk_index);
        return url;
    }

    void CompleteChunk(const std::string& session_id, std::uint32_t chunk_index, const std::string& etag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++complete_chunk_calls;
        auto it = sessions.find(session_id);
        if (it == sessions.end()) {
            throw SessionExpired(session_id);
        }
        it->second.completed.insert(chunk_index);
        it->second.etags[chunk_index] = etag;
    }

    transfer::CompletionResult Complete(const std::string& session_id, const transfer::UploadOptions& options) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++complete_calls;
        last_options = options;
        if (fail_complete) {
            throw ApiError(503, "storage unavailable");
        }
        auto it = sessions.find(session_id);
        if (it == sessions.end()) {
            throw SessionExpired(session_id);
        }
        if (it->second.completed.size() != it->second.total_chunks) {
            throw ApiError(400, "Upload incomplete");
        }
        it->second.finished = true;
        transfer::CompletionResult result;
        result.file_id = "file-" + session_id;
        result.retrieval_code = "CODE" + std::to_string(complete_calls);
        result.retrieval_url = "/d/" + result.retrieval_code;
        return result;
    }

    void Cancel(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cancel_calls;
        if (fail_cancel) {
            throw ApiError(0, "network unreachable");
        }
        sessions.erase(session_id);
    }

    std::vector<transfer::SessionSummary> ListActiveSessions() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++list_calls;
        if (fail_list) {
            throw ApiError(0, "network unreachable");
        }
        std::vector<transfer::SessionSummary> out;
        for (const auto& [id, session] : sessions) {
            if (session.finished) continue;
            transfer::SessionSummary summary;
            summary.session_id = id;
            summary.file_name = session.file_name;
            summary.file_size = session.file_size;
            summary.total_chunks = session.total_chunks;
            summary.completed_chunks.assign(session.completed.begin(), session.completed.end());
            out.push_back(summary);
        }
        return out;
    }

    void Forget(const std::string& session_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.erase(session_id);
    }

    void MarkCompleted(const std::string& session_id, std::uint32_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions[session_id].completed.insert(index);
    }

    std::set<std::uint32_t> Completed(const std::string& session_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions[session_id].completed;
    }

    std::string Etag(const std::string& session_id, std::uint32_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions[session_id].etags[index];
    }

    std::map<std::string, Session> sessions;
    transfer::InitiateRequest last_request;
    transfer::UploadOptions last_options;
    std::function<void(std::uint32_t)> on_get_url;
    int total_chunks_override = -1;
    bool fail_initiate = false;
    bool fail_list = false;
    bool fail_cancel = false;
    bool fail_complete = false;
    int initiate_calls = 0;
    int get_url_calls = 0;
    int complete_chunk_calls = 0;
    int complete_calls = 0;
    int cancel_calls = 0;
    int list_calls = 0;

private:
    std::mutex mutex_;
    ManualClock& clock_;
    std::uint64_t chunk_size_;
    int counter_ = 0;
};

// Transport that checks the bytes it is handed and can fail on demand.
class FakeTransport : public transfer::ChunkTransport {
public:
    std::string Put(const std::string& url,
                    const filestream::ByteSource& source,
                    std::uint64_t offset,
                    std::uint64_t length,
                    const std::string& content_type) override {
        std::uint32_t index = static_cast<std::uint32_t>(std::stoul(url.substr(url.rfind('/') + 1)));
        int now_active = ++active_;
        int seen = max_active_.load();
        while (now_active > seen && !max_active_.compare_exchange_weak(seen, now_active)) {
        }
        struct Leave {
            std::atomic<int>& active;
            ~Leave() { --active; }
        } leave{active_};

        bool should_fail = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++puts[index];
            last_content_type = content_type;
            auto it = failures.find(index);
            if (it != failures.end() && it->second > 0) {
                --it->second;
                should_fail = true;
            }
        }
        if (hold_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms));
        }
        if (on_put) {
            on_put(index);
        }
        if (should_fail || always_fail) {
            throw std::runtime_error("connection reset");
        }

        // Sample the head, middle and tail of the range.
        bool ok = length > 0;
        for (std::uint64_t at : {std::uint64_t{0}, length / 2, length - 1}) {
            if (!ok) break;
            std::uint8_t byte = 0;
            ok = source.ReadAt(offset + at, &byte, 1) == 1 && byte == PatternByte(offset + at);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ranges[index] = {offset, length};
            if (!ok) {
                bad_ranges.insert(index);
            }
        }
        if (empty_etag) {
            return "";
        }
        return "\"etag-" + std::to_string(index) + "\"";
    }

    int max_active() const { return max_active_.load(); }
    int PutCount(std::uint32_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        return puts[index];
    }
    int TotalPuts() {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& entry : puts) total += entry.second;
        return total;
    }

    std::map<std::uint32_t, int> failures;
    std::map<std::uint32_t, int> puts;
    std::map<std::uint32_t, std::pair<std::uint64_t, std::uint64_t>> ranges;
    std::set<std::uint32_t> bad_ranges;
    std::string last_content_type;
    std::function<void(std::uint32_t)> on_put;
    int hold_ms = 0;
    bool always_fail = false;
    bool empty_etag = false;

private:
    std::mutex mutex_;
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
};

}  // namespace sealdrop::testing
