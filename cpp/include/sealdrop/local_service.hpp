#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "sealdrop/constants.hpp"
#include "sealdrop/upload_api.hpp"

namespace sealdrop::transfer {

// Upload API and transport backed by a directory, for offline use and tests.
//
//   <root>/sessions.yaml                 open sessions
//   <root>/parts/<session>/<index>.part  received chunks
//   <root>/objects/<code>.sdx            finalized uploads
//   <root>/objects/<code>.yaml           their sharing options
//
// Chunk URLs look like local://<session>/<index>; integrity tokens are the
// SHA-256 hex digest of the chunk, checked again on CompleteChunk.
class LocalUploadService : public UploadSessionApi, public ChunkTransport {
public:
    explicit LocalUploadService(std::filesystem::path root,
                                std::uint64_t chunk_size = constants::kDefaultChunkSize,
                                std::function<TimePoint()> now = {});

    InitiateResponse Initiate(const InitiateRequest& request) override;
    UploadUrl GetUploadUrl(const std::string& session_id, std::uint32_t chunk_index) override;
    void CompleteChunk(const std::string& session_id, std::uint32_t chunk_index, const std::string& etag) override;
    CompletionResult Complete(const std::string& session_id, const UploadOptions& options) override;
    void Cancel(const std::string& session_id) override;
    std::vector<SessionSummary> ListActiveSessions() override;

    std::string Put(const std::string& url,
                    const filestream::ByteSource& source,
                    std::uint64_t offset,
                    std::uint64_t length,
                    const std::string& content_type) override;

    std::filesystem::path ObjectPath(const std::string& retrieval_code) const;
    const std::filesystem::path& root() const noexcept { return root_; }

private:
    struct ServerSession {
        std::string upload_id;
        std::string file_name;
        std::uint64_t file_size = 0;
        std::string content_type;
        std::uint64_t chunk_size = 0;
        std::uint32_t total_chunks = 0;
        TimePoint created_at{};
        TimePoint expires_at{};
        std::map<std::uint32_t, std::string> parts;
        std::map<std::string, std::string> metadata;
    };

    // Throws SessionExpired for an unknown or expired session.
    ServerSession& FindLocked(const std::string& session_id);
    bool PruneExpiredLocked();
    void LoadLocked();
    void SaveLocked() const;

    std::filesystem::path PartsDir(const std::string& session_id) const;
    std::filesystem::path PartPath(const std::string& session_id, std::uint32_t index) const;
    std::uint64_t ExpectedChunkSize(const ServerSession& session, std::uint32_t index) const;

    std::filesystem::path root_;
    std::uint64_t chunk_size_;
    std::function<TimePoint()> now_;
    mutable std::mutex mutex_;
    std::map<std::string, ServerSession> sessions_;
};

}  // namespace sealdrop::transfer
