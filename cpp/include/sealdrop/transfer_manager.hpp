#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sealdrop/config.hpp"
#include "sealdrop/session.hpp"
#include "sealdrop/session_store.hpp"
#include "sealdrop/upload_api.hpp"

namespace sealdrop::transfer {

struct UploadProgress {
    double progress = 0.0;  // percent
    std::uint32_t completed_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;
};

// Invoked once per confirmed chunk, never concurrently for the same upload.
using UploadProgressCallback = std::function<void(const UploadProgress&)>;

struct IncompleteUpload {
    bool exists = false;
    std::optional<TransferSession> session;
    std::uint32_t completed_chunks = 0;
    std::uint32_t total_chunks = 0;
};

// Drives resumable chunked uploads. All methods are thread-safe; Pause,
// Cancel and SetOnline are meant to be called while UploadFile runs on
// another thread.
class TransferManager {
public:
    TransferManager(UploadSessionApi& api, ChunkTransport& transport, SessionStore& store,
                    TransferConfig config = {});
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    IncompleteUpload CheckIncompleteUpload(const FileHandle& file);
    TransferSession InitiateUpload(const FileHandle& file, const std::map<std::string, std::string>& metadata = {});
    // Throws SessionExpired for a session that is unknown locally or remotely.
    TransferSession ResumeUpload(const std::string& file_id, const FileHandle& file);

    // Returns the completion result, or nullopt when the upload was paused
    // before it finished. Throws ChunkUploadFailed, SessionExpired,
    // SessionCancelled or TransferError.
    std::optional<CompletionResult> UploadFile(const std::string& file_id,
                                               const UploadOptions& options,
                                               const UploadProgressCallback& on_progress = {});

    void Pause(const std::string& file_id);
    void Cancel(const std::string& file_id);
    void SetOnline(bool online);
    bool online() const noexcept { return online_.load(); }

    std::optional<TransferSession> GetSession(const std::string& file_id) const;
    std::vector<TransferSession> GetAllSessions() const;

private:
    struct UploadControl;

    void UploadChunk(UploadControl& control, const std::string& file_id, const std::string& session_id,
                     const Chunk& chunk, const std::string& content_type,
                     const filestream::ByteSource& source, const UploadProgressCallback& on_progress);
    void RecordCompletion(UploadControl& control, const std::string& file_id, std::uint32_t index,
                          const UploadProgressCallback& on_progress);

    void RefreshFromStoreLocked();
    bool PruneStaleLocked();
    void SaveLocked();
    void EraseLocked(const std::string& file_id);

    UploadSessionApi& api_;
    ChunkTransport& transport_;
    SessionStore& store_;
    TransferConfig config_;

    mutable std::mutex mutex_;
    SessionTable sessions_;
    std::map<std::string, std::shared_ptr<filestream::ByteSource>> sources_;
    std::map<std::string, std::shared_ptr<UploadControl>> controls_;
    std::atomic<bool> online_{true};
};

}  // namespace sealdrop::transfer
