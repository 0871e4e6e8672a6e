#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sealdrop/constants.hpp"
#include "sealdrop/file_stream.hpp"
#include "sealdrop/session.hpp"

namespace sealdrop::transfer {

struct InitiateRequest {
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string content_type;
    std::map<std::string, std::string> metadata;
};

struct InitiateResponse {
    std::string session_id;
    std::string upload_id;
    std::uint32_t total_chunks = 0;
    std::uint64_t chunk_size = 0;
    TimePoint expires_at{};
};

struct UploadUrl {
    std::string url;
    bool already_uploaded = false;
};

struct SessionSummary {
    std::string session_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint32_t total_chunks = 0;
    std::vector<std::uint32_t> completed_chunks;
    TimePoint expires_at{};
};

struct UploadOptions {
    std::uint32_t expiration_hours = constants::kDefaultExpirationHours;
    std::optional<std::uint32_t> max_downloads;
    std::optional<std::string> description;
    bool is_public = false;

    // Throws std::invalid_argument unless 1 <= expiration_hours <= 720 and
    // max_downloads, when present, is positive.
    void Validate() const;
};

struct CompletionResult {
    std::string file_id;
    std::string retrieval_code;
    std::string retrieval_url;
};

// The remote upload API. Implementations report failures as ApiError, or as
// SessionExpired when the server no longer knows the session.
class UploadSessionApi {
public:
    virtual ~UploadSessionApi() = default;

    virtual InitiateResponse Initiate(const InitiateRequest& request) = 0;
    virtual UploadUrl GetUploadUrl(const std::string& session_id, std::uint32_t chunk_index) = 0;
    virtual void CompleteChunk(const std::string& session_id, std::uint32_t chunk_index, const std::string& etag) = 0;
    virtual CompletionResult Complete(const std::string& session_id, const UploadOptions& options) = 0;
    virtual void Cancel(const std::string& session_id) = 0;
    virtual std::vector<SessionSummary> ListActiveSessions() = 0;
};

// Moves one byte range to a presigned URL and returns the integrity token
// (ETag) the storage answered with, possibly empty.
class ChunkTransport {
public:
    virtual ~ChunkTransport() = default;

    virtual std::string Put(const std::string& url,
                            const filestream::ByteSource& source,
                            std::uint64_t offset,
                            std::uint64_t length,
                            const std::string& content_type) = 0;
};

}  // namespace sealdrop::transfer
