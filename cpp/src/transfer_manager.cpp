#include "sealdrop/transfer_manager.hpp"

#include "sealdrop/errors.hpp"
#include "sealdrop/log.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>
#include <thread>

namespace sealdrop::transfer {

namespace {

// Thrown between retry attempts when the upload was paused. Not an error.
struct StopRequested {};

std::string StripQuotes(const std::string& etag) {
    std::string out;
    out.reserve(etag.size());
    for (char ch : etag) {
        if (ch != '"') {
            out.push_back(ch);
        }
    }
    return out;
}

}  // namespace

struct TransferManager::UploadControl {
    std::atomic<bool> paused{false};
    std::atomic<bool> cancelled{false};
    std::atomic<bool> halted{false};
    std::mutex completion_mutex;
    std::mutex failure_mutex;
    std::exception_ptr failure;

    bool ShouldStop() const { return paused.load() || cancelled.load() || halted.load(); }

    void Fail(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (!failure) {
            failure = std::move(error);
        }
        halted.store(true);
    }

    std::exception_ptr Failure() {
        std::lock_guard<std::mutex> lock(failure_mutex);
        return failure;
    }
};

TransferManager::TransferManager(UploadSessionApi& api, ChunkTransport& transport, SessionStore& store,
                                 TransferConfig config)
    : api_(api), transport_(transport), store_(store), config_(std::move(config)) {
    if (config_.max_concurrency == 0) {
        throw std::invalid_argument("max_concurrency must be positive");
    }
    if (!config_.now) {
        config_.now = [] { return Clock::now(); };
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_ = store_.Load();
    if (PruneStaleLocked()) {
        SaveLocked();
    }
}

TransferManager::~TransferManager() = default;

IncompleteUpload TransferManager::CheckIncompleteUpload(const FileHandle& file) {
    const std::string file_id = file.FileId();
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RefreshFromStoreLocked();
        auto it = sessions_.find(file_id);
        if (it == sessions_.end() || it->second.status == SessionStatus::kCompleted) {
            return {};
        }
        session_id = it->second.session_id;
    }

    std::vector<SessionSummary> remote;
    try {
        remote = api_.ListActiveSessions();
    } catch (const std::exception& e) {
        log::Warn(std::string("Could not verify upload session with the server: ") + e.what());
        return {};
    }

    auto match = std::find_if(remote.begin(), remote.end(),
                              [&](const SessionSummary& summary) { return summary.session_id == session_id; });

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(file_id);
    if (it == sessions_.end() || it->second.session_id != session_id) {
        return {};
    }
    if (match == remote.end()) {
        log::Info("Server no longer knows session " + session_id + "; dropping local state");
        EraseLocked(file_id);
        SaveLocked();
        return {};
    }
    if (controls_.count(file_id) == 0) {
        it->second.ResetCompleted(std::set<std::uint32_t>(match->completed_chunks.begin(),
                                                          match->completed_chunks.end()));
        SaveLocked();
    }

    IncompleteUpload result;
    result.exists = true;
    result.session = it->second;
    result.completed_chunks = static_cast<std::uint32_t>(it->second.completed_chunks.size());
    result.total_chunks = it->second.total_chunks;
    return result;
}

TransferSession TransferManager::InitiateUpload(const FileHandle& file,
                                                const std::map<std::string, std::string>& metadata) {
    if (!file.source) {
        throw std::invalid_argument("File handle has no byte source");
    }
    if (file.source->Size() != file.size) {
        throw std::invalid_argument("File handle size does not match its byte source");
    }
    const std::string file_id = file.FileId();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (controls_.count(file_id) != 0) {
            throw TransferError(file_id, std::nullopt, "An upload for this file is already running");
        }
    }

    TransferSession session;
    session.file_id = file_id;
    session.file_name = file.name;
    session.file_size = file.size;
    session.content_type = file.content_type.empty() ? std::string(constants::kDefaultContentType)
                                                     : file.content_type;
    session.metadata = metadata;
    session.TransitionTo(SessionStatus::kChecking);

    InitiateRequest request;
    request.file_name = session.file_name;
    request.file_size = session.file_size;
    request.content_type = session.content_type;
    request.metadata = metadata;
    InitiateResponse response;
    try {
        response = api_.Initiate(request);
    } catch (const std::exception& e) {
        throw TransferError(file_id, std::nullopt, std::string("Failed to initiate upload: ") + e.what());
    }

    if (response.chunk_size == 0) {
        throw TransferError(file_id, std::nullopt, "Server returned a zero chunk size");
    }
    session.session_id = response.session_id;
    session.upload_id = response.upload_id;
    session.chunk_size = response.chunk_size;
    session.chunks = CalculateChunks(session.file_size, session.chunk_size);
    session.total_chunks = static_cast<std::uint32_t>(session.chunks.size());
    if (session.total_chunks != response.total_chunks) {
        throw TransferError(file_id, std::nullopt,
                            "Server expects " + std::to_string(response.total_chunks) + " chunks, client computed " +
                                std::to_string(session.total_chunks));
    }
    session.started_at = config_.now();
    session.expires_at = response.expires_at;
    session.RecomputeProgress();
    session.TransitionTo(SessionStatus::kActive);

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[file_id] = session;
    sources_[file_id] = file.source;
    SaveLocked();
    log::Info("Started upload session " + session.session_id + " with " + std::to_string(session.total_chunks) +
              " chunks");
    return session;
}

TransferSession TransferManager::ResumeUpload(const std::string& file_id, const FileHandle& file) {
    if (!file.source) {
        throw std::invalid_argument("File handle has no byte source");
    }
    if (file.FileId() != file_id) {
        throw TransferError(file_id, std::nullopt, "File does not match the stored upload session");
    }

    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (controls_.count(file_id) != 0) {
            throw TransferError(file_id, std::nullopt, "An upload for this file is already running");
        }
        RefreshFromStoreLocked();
        auto it = sessions_.find(file_id);
        if (it == sessions_.end() || it->second.status == SessionStatus::kCompleted) {
            throw SessionExpired(file_id);
        }
        if (it->second.file_size != file.source->Size()) {
            throw TransferError(file_id, std::nullopt, "File size changed since the upload started");
        }
        session_id = it->second.session_id;
    }

    std::vector<SessionSummary> remote;
    try {
        remote = api_.ListActiveSessions();
    } catch (const SessionExpired&) {
        throw SessionExpired(file_id);
    } catch (const std::exception& e) {
        throw TransferError(file_id, std::nullopt, std::string("Failed to check upload session: ") + e.what());
    }
    auto match = std::find_if(remote.begin(), remote.end(),
                              [&](const SessionSummary& summary) { return summary.session_id == session_id; });

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(file_id);
    if (it == sessions_.end() || it->second.session_id != session_id) {
        throw SessionExpired(file_id);
    }
    if (match == remote.end()) {
        EraseLocked(file_id);
        SaveLocked();
        throw SessionExpired(file_id);
    }
    TransferSession& session = it->second;
    session.chunks = CalculateChunks(session.file_size, session.chunk_size);
    session.ResetCompleted(std::set<std::uint32_t>(match->completed_chunks.begin(), match->completed_chunks.end()));
    sources_[file_id] = file.source;
    SaveLocked();
    log::Info("Resuming session " + session_id + ": " + std::to_string(session.completed_chunks.size()) + "/" +
              std::to_string(session.total_chunks) + " chunks already stored");
    return session;
}

std::optional<CompletionResult> TransferManager::UploadFile(const std::string& file_id,
                                                            const UploadOptions& options,
                                                            const UploadProgressCallback& on_progress) {
    options.Validate();

    auto control = std::make_shared<UploadControl>();
    std::vector<Chunk> pending;
    std::string session_id;
    std::string content_type;
    std::shared_ptr<filestream::ByteSource> source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(file_id);
        if (it == sessions_.end()) {
            throw SessionExpired(file_id);
        }
        if (it->second.IsExpired(config_.now())) {
            EraseLocked(file_id);
            SaveLocked();
            throw SessionExpired(file_id);
        }
        if (controls_.count(file_id) != 0) {
            throw TransferError(file_id, std::nullopt, "An upload for this file is already running");
        }
        auto src = sources_.find(file_id);
        if (src == sources_.end() || !src->second) {
            throw TransferError(file_id, std::nullopt, "No file attached to the session; resume it first");
        }
        TransferSession& session = it->second;
        session.TransitionTo(SessionStatus::kUploading);
        session.last_error.clear();
        for (const Chunk& chunk : session.chunks) {
            if (session.completed_chunks.count(chunk.index) == 0) {
                pending.push_back(chunk);
            }
        }
        session_id = session.session_id;
        content_type = session.content_type;
        source = src->second;
        control->paused.store(!online_.load());
        controls_[file_id] = control;
        SaveLocked();
    }

    struct ControlGuard {
        TransferManager& owner;
        const std::string& id;
        ~ControlGuard() {
            std::lock_guard<std::mutex> lock(owner.mutex_);
            owner.controls_.erase(id);
        }
    } guard{*this, file_id};

    const std::size_t workers = std::min(config_.max_concurrency, pending.size());
    std::atomic<std::size_t> next{0};
    auto work = [&]() {
        while (!control->ShouldStop()) {
            std::size_t idx = next.fetch_add(1);
            if (idx >= pending.size()) {
                break;
            }
            UploadChunk(*control, file_id, session_id, pending[idx], content_type, *source, on_progress);
        }
    };
    if (workers <= 1) {
        work();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back(work);
        }
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (control->cancelled.load()) {
            throw SessionCancelled(file_id);
        }
        auto it = sessions_.find(file_id);
        if (it == sessions_.end()) {
            throw SessionExpired(file_id);
        }
        TransferSession& session = it->second;
        if (std::exception_ptr failure = control->Failure()) {
            try {
                std::rethrow_exception(failure);
            } catch (const SessionExpired&) {
                EraseLocked(file_id);
                SaveLocked();
                throw;
            } catch (const std::exception& e) {
                session.TransitionTo(SessionStatus::kError);
                session.last_error = e.what();
                SaveLocked();
                throw;
            }
        }
        if (control->paused.load() || !session.AllChunksDone()) {
            session.TransitionTo(SessionStatus::kPaused);
            SaveLocked();
            log::Info("Upload paused at " + std::to_string(session.completed_chunks.size()) + "/" +
                      std::to_string(session.total_chunks) + " chunks");
            return std::nullopt;
        }
    }

    CompletionResult result;
    try {
        result = api_.Complete(session_id, options);
    } catch (const SessionExpired&) {
        std::lock_guard<std::mutex> lock(mutex_);
        EraseLocked(file_id);
        SaveLocked();
        throw SessionExpired(file_id);
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(file_id);
        if (it != sessions_.end()) {
            it->second.TransitionTo(SessionStatus::kError);
            it->second.last_error = e.what();
            SaveLocked();
        }
        throw TransferError(file_id, std::nullopt, std::string("Failed to finalize upload: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(file_id);
    if (it != sessions_.end()) {
        it->second.TransitionTo(SessionStatus::kCompleted);
        it->second.progress = 100.0;
        EraseLocked(file_id);
        SaveLocked();
    }
    return result;
}

void TransferManager::UploadChunk(UploadControl& control, const std::string& file_id, const std::string& session_id,
                                  const Chunk& chunk, const std::string& content_type,
                                  const filestream::ByteSource& source, const UploadProgressCallback& on_progress) {
    std::uint32_t attempts = 0;
    try {
        config_.retry.Run(
            [&]() {
                UploadUrl target = api_.GetUploadUrl(session_id, chunk.index);
                if (target.already_uploaded) {
                    return;
                }
                std::string etag = StripQuotes(transport_.Put(target.url, source, chunk.start, chunk.Size(),
                                                              content_type));
                if (etag.empty()) {
                    etag = "chunk-" + std::to_string(chunk.index);
                }
                api_.CompleteChunk(session_id, chunk.index, etag);
            },
            config_.sleep,
            [&](std::uint32_t attempt, const std::string& reason) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto it = sessions_.find(file_id);
                    if (it != sessions_.end() && chunk.index < it->second.chunks.size()) {
                        it->second.chunks[chunk.index].retry_count = attempt;
                    }
                }
                log::Info("Chunk " + std::to_string(chunk.index) + " attempt " + std::to_string(attempt) +
                          " failed: " + reason);
                if (control.cancelled.load()) {
                    throw SessionCancelled(file_id);
                }
                if (control.paused.load()) {
                    throw StopRequested{};
                }
            },
            attempts);
    } catch (const StopRequested&) {
        return;
    } catch (const SessionCancelled&) {
        return;
    } catch (const SessionExpired&) {
        control.Fail(std::make_exception_ptr(SessionExpired(file_id)));
        return;
    } catch (const std::exception& e) {
        control.Fail(std::make_exception_ptr(ChunkUploadFailed(file_id, chunk.index, attempts, e.what())));
        return;
    }

    try {
        RecordCompletion(control, file_id, chunk.index, on_progress);
    } catch (const std::exception&) {
        control.Fail(std::current_exception());
    }
}

void TransferManager::RecordCompletion(UploadControl& control, const std::string& file_id, std::uint32_t index,
                                       const UploadProgressCallback& on_progress) {
    std::lock_guard<std::mutex> completion(control.completion_mutex);
    UploadProgress progress;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(file_id);
        if (it == sessions_.end()) {
            return;
        }
        TransferSession& session = it->second;
        session.MarkCompleted(index);
        SaveLocked();
        progress.progress = session.progress;
        progress.completed_chunks = static_cast<std::uint32_t>(session.completed_chunks.size());
        progress.total_chunks = session.total_chunks;
        progress.uploaded_bytes = session.UploadedBytes();
        progress.total_bytes = session.file_size;
    }
    if (on_progress && !control.cancelled.load()) {
        on_progress(progress);
    }
}

void TransferManager::Pause(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto control = controls_.find(file_id);
    if (control != controls_.end()) {
        control->second->paused.store(true);
    }
    auto it = sessions_.find(file_id);
    if (it == sessions_.end()) {
        return;
    }
    SessionStatus status = it->second.status;
    if (status == SessionStatus::kUploading || status == SessionStatus::kActive) {
        it->second.TransitionTo(SessionStatus::kPaused);
        SaveLocked();
    }
}

void TransferManager::Cancel(const std::string& file_id) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto control = controls_.find(file_id);
        if (control != controls_.end()) {
            control->second->cancelled.store(true);
        }
        auto it = sessions_.find(file_id);
        if (it == sessions_.end()) {
            return;
        }
        if (CanTransition(it->second.status, SessionStatus::kCancelled)) {
            it->second.TransitionTo(SessionStatus::kCancelled);
            session_id = it->second.session_id;
        }
        EraseLocked(file_id);
        SaveLocked();
    }
    if (session_id.empty()) {
        return;
    }
    try {
        api_.Cancel(session_id);
    } catch (const std::exception& e) {
        log::Warn("Failed to cancel session " + session_id + " on the server: " + e.what());
    }
}

void TransferManager::SetOnline(bool online) {
    online_.store(online);
    if (online) {
        log::Info("Connection restored; resume uploads explicitly");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    bool changed = false;
    for (auto& [file_id, control] : controls_) {
        control->paused.store(true);
        auto it = sessions_.find(file_id);
        if (it != sessions_.end() && it->second.status == SessionStatus::kUploading) {
            it->second.TransitionTo(SessionStatus::kPaused);
            changed = true;
        }
    }
    if (changed) {
        SaveLocked();
    }
    log::Info("Connection lost; uploads paused");
}

std::optional<TransferSession> TransferManager::GetSession(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(file_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TransferSession> TransferManager::GetAllSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferSession> out;
    out.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        out.push_back(entry.second);
    }
    return out;
}

void TransferManager::RefreshFromStoreLocked() {
    SessionTable loaded = store_.Load();
    for (auto& [file_id, session] : sessions_) {
        if (controls_.count(file_id) != 0) {
            loaded[file_id] = session;
        }
    }
    for (auto& [file_id, session] : loaded) {
        if (session.chunks.empty() && session.total_chunks > 0) {
            session.chunks = CalculateChunks(session.file_size, session.chunk_size);
            session.ResetCompleted(std::set<std::uint32_t>(session.completed_chunks));
        }
    }
    sessions_ = std::move(loaded);
    for (auto it = sources_.begin(); it != sources_.end();) {
        if (sessions_.count(it->first) == 0) {
            it = sources_.erase(it);
        } else {
            ++it;
        }
    }
    if (PruneStaleLocked()) {
        SaveLocked();
    }
}

bool TransferManager::PruneStaleLocked() {
    const TimePoint now = config_.now();
    bool pruned = false;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (controls_.count(it->first) != 0) {
            ++it;
            continue;
        }
        // A completed entry only survives a purge that was interrupted.
        if (it->second.status == SessionStatus::kCompleted || it->second.IsExpired(now)) {
            log::Info("Dropping finished or expired upload session for " + it->second.file_name);
            sources_.erase(it->first);
            it = sessions_.erase(it);
            pruned = true;
        } else {
            ++it;
        }
    }
    return pruned;
}

void TransferManager::SaveLocked() {
    store_.Save(sessions_);
}

void TransferManager::EraseLocked(const std::string& file_id) {
    sessions_.erase(file_id);
    sources_.erase(file_id);
}

}  // namespace sealdrop::transfer
