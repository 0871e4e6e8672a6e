#include "sealdrop/local_service.hpp"

#include "sealdrop/crypto.hpp"
#include "sealdrop/errors.hpp"
#include "sealdrop/file_stream.hpp"
#include "sealdrop/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace sealdrop::transfer {

namespace {

constexpr std::string_view kUrlScheme = "local://";
constexpr std::string_view kCodeAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
constexpr std::size_t kCodeLen = 10;

std::string RandomHex(std::size_t bytes) {
    return crypto::HexEncode(crypto::RandomBytes(bytes));
}

std::string RandomCode() {
    crypto::Bytes raw = crypto::RandomBytes(kCodeLen);
    std::string code;
    code.reserve(kCodeLen);
    for (std::uint8_t byte : raw) {
        code.push_back(kCodeAlphabet[byte % kCodeAlphabet.size()]);
    }
    return code;
}

std::string HashFile(const std::filesystem::path& path) {
    filestream::BufferedFileReader<constants::kReadBlockSize> reader(path);
    crypto::Sha256 hasher;
    while (reader.HasMore()) {
        auto [data, size] = reader.ReadChunk();
        if (size == 0) {
            break;
        }
        hasher.Update(data, size);
    }
    return crypto::HexEncode(hasher.Final());
}

bool ParseUrl(const std::string& url, std::string& session_id, std::uint32_t& index) {
    if (url.compare(0, kUrlScheme.size(), kUrlScheme) != 0) {
        return false;
    }
    std::string rest = url.substr(kUrlScheme.size());
    std::size_t slash = rest.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= rest.size()) {
        return false;
    }
    session_id = rest.substr(0, slash);
    std::string number = rest.substr(slash + 1);
    if (number.find_first_not_of("0123456789") != std::string::npos || number.size() > 9) {
        return false;
    }
    index = static_cast<std::uint32_t>(std::stoul(number));
    return true;
}

void WriteText(const std::filesystem::path& path, const std::string& text) {
    filestream::WriteFileAtomic(path, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

}  // namespace

LocalUploadService::LocalUploadService(std::filesystem::path root, std::uint64_t chunk_size,
                                       std::function<TimePoint()> now)
    : root_(std::move(root)), chunk_size_(chunk_size), now_(std::move(now)) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
    std::filesystem::create_directories(root_ / "parts");
    std::filesystem::create_directories(root_ / "objects");
    std::lock_guard<std::mutex> lock(mutex_);
    LoadLocked();
}

InitiateResponse LocalUploadService::Initiate(const InitiateRequest& request) {
    if (request.file_name.empty()) {
        throw ApiError(400, "File name is required");
    }
    if (request.file_size == 0) {
        throw ApiError(400, "File size must be positive");
    }
    ServerSession session;
    session.upload_id = RandomHex(8);
    session.file_name = request.file_name;
    session.file_size = request.file_size;
    session.content_type = request.content_type.empty() ? std::string(constants::kDefaultContentType)
                                                        : request.content_type;
    session.chunk_size = chunk_size_;
    session.total_chunks = ChunkCount(request.file_size, chunk_size_);
    session.created_at = now_();
    session.expires_at = session.created_at + std::chrono::hours(constants::kSessionLifetimeHours);
    session.metadata = request.metadata;

    const std::string session_id = RandomHex(16);
    std::filesystem::create_directories(PartsDir(session_id));

    InitiateResponse response;
    response.session_id = session_id;
    response.upload_id = session.upload_id;
    response.total_chunks = session.total_chunks;
    response.chunk_size = session.chunk_size;
    response.expires_at = session.expires_at;

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.emplace(session_id, std::move(session));
    SaveLocked();
    return response;
}

UploadUrl LocalUploadService::GetUploadUrl(const std::string& session_id, std::uint32_t chunk_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    ServerSession& session = FindLocked(session_id);
    if (chunk_index >= session.total_chunks) {
        throw ApiError(400, "Chunk index out of range");
    }
    UploadUrl result;
    if (session.parts.count(chunk_index) != 0) {
        result.already_uploaded = true;
        return result;
    }
    result.url = std::string(kUrlScheme) + session_id + "/" + std::to_string(chunk_index);
    return result;
}

std::string LocalUploadService::Put(const std::string& url,
                                    const filestream::ByteSource& source,
                                    std::uint64_t offset,
                                    std::uint64_t length,
                                    const std::string&) {
    std::string session_id;
    std::uint32_t index = 0;
    if (!ParseUrl(url, session_id, index)) {
        throw ApiError(400, "Malformed upload URL");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end() || index >= it->second.total_chunks) {
            throw ApiError(404, "No such upload target");
        }
        if (length != ExpectedChunkSize(it->second, index)) {
            throw ApiError(400, "Chunk " + std::to_string(index) + " has the wrong length");
        }
    }
    if (offset + length > source.Size()) {
        throw std::runtime_error("Byte range exceeds the source");
    }

    const std::filesystem::path target = PartPath(session_id, index);
    std::filesystem::path temp = target;
    temp += ".tmp";
    crypto::Sha256 hasher;
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ApiError(500, "Failed to open part file");
        }
        std::vector<std::uint8_t> buffer(constants::kReadBlockSize);
        std::uint64_t done = 0;
        while (done < length) {
            std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), length - done));
            std::size_t got = source.ReadAt(offset + done, buffer.data(), want);
            if (got == 0) {
                throw std::runtime_error("Short read from source");
            }
            out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(got));
            hasher.Update(buffer.data(), got);
            done += got;
        }
        if (!out) {
            throw ApiError(500, "Failed to write part file");
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        throw ApiError(500, "Failed to store part: " + ec.message());
    }
    return "\"" + crypto::HexEncode(hasher.Final()) + "\"";
}

void LocalUploadService::CompleteChunk(const std::string& session_id, std::uint32_t chunk_index,
                                       const std::string& etag) {
    std::filesystem::path part;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ServerSession& session = FindLocked(session_id);
        if (chunk_index >= session.total_chunks) {
            throw ApiError(400, "Chunk index out of range");
        }
        part = PartPath(session_id, chunk_index);
    }
    std::error_code ec;
    if (!std::filesystem::exists(part, ec)) {
        throw ApiError(400, "Chunk " + std::to_string(chunk_index) + " was never received");
    }
    if (HashFile(part) != etag) {
        throw ApiError(400, "Integrity token mismatch for chunk " + std::to_string(chunk_index));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ServerSession& session = FindLocked(session_id);
    session.parts[chunk_index] = etag;
    SaveLocked();
}

CompletionResult LocalUploadService::Complete(const std::string& session_id, const UploadOptions& options) {
    try {
        options.Validate();
    } catch (const std::invalid_argument& e) {
        throw ApiError(422, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ServerSession& session = FindLocked(session_id);
    if (session.parts.size() != session.total_chunks) {
        throw ApiError(400, "Upload incomplete. " + std::to_string(session.parts.size()) + "/" +
                                std::to_string(session.total_chunks) + " chunks uploaded");
    }

    CompletionResult result;
    result.retrieval_code = RandomCode();
    result.file_id = RandomHex(8);
    result.retrieval_url = "/d/" + result.retrieval_code;

    const std::filesystem::path object = ObjectPath(result.retrieval_code);
    std::filesystem::path temp = object;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ApiError(500, "Failed to create object");
        }
        for (std::uint32_t i = 0; i < session.total_chunks; ++i) {
            std::ifstream in(PartPath(session_id, i), std::ios::binary);
            if (!in) {
                throw ApiError(500, "Part " + std::to_string(i) + " is missing");
            }
            out << in.rdbuf();
        }
        if (!out) {
            throw ApiError(500, "Failed to write object");
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, object, ec);
    if (ec) {
        throw ApiError(500, "Failed to finalize object: " + ec.message());
    }

    YAML::Emitter manifest;
    manifest << YAML::BeginMap;
    manifest << YAML::Key << "fileId"      << YAML::Value << result.file_id;
    manifest << YAML::Key << "fileName"    << YAML::Value << session.file_name;
    manifest << YAML::Key << "fileSize"    << YAML::Value << session.file_size;
    manifest << YAML::Key << "contentType" << YAML::Value << session.content_type;
    manifest << YAML::Key << "createdAt"   << YAML::Value << FormatTimestamp(now_());
    manifest << YAML::Key << "expiresAt"   << YAML::Value
             << FormatTimestamp(now_() + std::chrono::hours(options.expiration_hours));
    if (options.max_downloads) {
        manifest << YAML::Key << "maxDownloads" << YAML::Value << *options.max_downloads;
    }
    if (options.description) {
        manifest << YAML::Key << "description" << YAML::Value << *options.description;
    }
    manifest << YAML::Key << "isPublic" << YAML::Value << options.is_public;
    manifest << YAML::EndMap;
    std::filesystem::path manifest_path = root_ / "objects" / (result.retrieval_code + ".yaml");
    WriteText(manifest_path, std::string(manifest.c_str()) + "\n");

    std::filesystem::remove_all(PartsDir(session_id), ec);
    sessions_.erase(session_id);
    SaveLocked();
    return result;
}

void LocalUploadService::Cancel(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw ApiError(404, "Upload session not found");
    }
    sessions_.erase(it);
    std::error_code ec;
    std::filesystem::remove_all(PartsDir(session_id), ec);
    SaveLocked();
}

std::vector<SessionSummary> LocalUploadService::ListActiveSessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (PruneExpiredLocked()) {
        SaveLocked();
    }
    std::vector<SessionSummary> out;
    out.reserve(sessions_.size());
    for (const auto& [session_id, session] : sessions_) {
        SessionSummary summary;
        summary.session_id = session_id;
        summary.file_name = session.file_name;
        summary.file_size = session.file_size;
        summary.total_chunks = session.total_chunks;
        for (const auto& part : session.parts) {
            summary.completed_chunks.push_back(part.first);
        }
        summary.expires_at = session.expires_at;
        out.push_back(std::move(summary));
    }
    return out;
}

std::filesystem::path LocalUploadService::ObjectPath(const std::string& retrieval_code) const {
    return root_ / "objects" / (retrieval_code + std::string(constants::kEnvelopeExt));
}

LocalUploadService::ServerSession& LocalUploadService::FindLocked(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw SessionExpired(session_id);
    }
    if (now_() >= it->second.expires_at) {
        std::error_code ec;
        std::filesystem::remove_all(PartsDir(session_id), ec);
        sessions_.erase(it);
        SaveLocked();
        throw SessionExpired(session_id);
    }
    return it->second;
}

bool LocalUploadService::PruneExpiredLocked() {
    const TimePoint now = now_();
    bool pruned = false;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now >= it->second.expires_at) {
            std::error_code ec;
            std::filesystem::remove_all(PartsDir(it->first), ec);
            it = sessions_.erase(it);
            pruned = true;
        } else {
            ++it;
        }
    }
    return pruned;
}

void LocalUploadService::LoadLocked() {
    const std::filesystem::path path = root_ / "sessions.yaml";
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return;
    }
    try {
        YAML::Node doc = YAML::LoadFile(path.string());
        const YAML::Node list = doc["sessions"];
        if (!list || !list.IsMap()) {
            return;
        }
        for (const auto& entry : list) {
            const YAML::Node& node = entry.second;
            ServerSession session;
            session.upload_id = node["uploadId"].as<std::string>("");
            session.file_name = node["fileName"].as<std::string>();
            session.file_size = node["fileSize"].as<std::uint64_t>();
            session.content_type = node["contentType"].as<std::string>(std::string(constants::kDefaultContentType));
            session.chunk_size = node["chunkSize"].as<std::uint64_t>();
            session.total_chunks = node["totalChunks"].as<std::uint32_t>();
            auto created = ParseTimestamp(node["createdAt"].as<std::string>(""));
            auto expires = ParseTimestamp(node["expiresAt"].as<std::string>(""));
            if (!created || !expires) {
                continue;
            }
            session.created_at = *created;
            session.expires_at = *expires;
            if (const YAML::Node parts = node["parts"]) {
                for (const auto& part : parts) {
                    session.parts[part.first.as<std::uint32_t>()] = part.second.as<std::string>();
                }
            }
            if (const YAML::Node meta = node["metadata"]) {
                for (const auto& item : meta) {
                    session.metadata[item.first.as<std::string>()] = item.second.as<std::string>();
                }
            }
            sessions_.emplace(entry.first.as<std::string>(), std::move(session));
        }
    } catch (const YAML::Exception& e) {
        log::Warn("Ignoring unreadable service state " + path.string() + ": " + e.what());
        sessions_.clear();
    }
}

void LocalUploadService::SaveLocked() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "sessions" << YAML::Value << YAML::BeginMap;
    for (const auto& [session_id, session] : sessions_) {
        out << YAML::Key << session_id << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "uploadId"    << YAML::Value << session.upload_id;
        out << YAML::Key << "fileName"    << YAML::Value << session.file_name;
        out << YAML::Key << "fileSize"    << YAML::Value << session.file_size;
        out << YAML::Key << "contentType" << YAML::Value << session.content_type;
        out << YAML::Key << "chunkSize"   << YAML::Value << session.chunk_size;
        out << YAML::Key << "totalChunks" << YAML::Value << session.total_chunks;
        out << YAML::Key << "createdAt"   << YAML::Value << FormatTimestamp(session.created_at);
        out << YAML::Key << "expiresAt"   << YAML::Value << FormatTimestamp(session.expires_at);
        out << YAML::Key << "parts" << YAML::Value << YAML::BeginMap;
        for (const auto& [index, etag] : session.parts) {
            out << YAML::Key << index << YAML::Value << etag;
        }
        out << YAML::EndMap;
        if (!session.metadata.empty()) {
            out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
            for (const auto& [key, value] : session.metadata) {
                out << YAML::Key << key << YAML::Value << value;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    WriteText(root_ / "sessions.yaml", std::string(out.c_str()) + "\n");
}

std::filesystem::path LocalUploadService::PartsDir(const std::string& session_id) const {
    return root_ / "parts" / session_id;
}

std::filesystem::path LocalUploadService::PartPath(const std::string& session_id, std::uint32_t index) const {
    return PartsDir(session_id) / (std::to_string(index) + ".part");
}

std::uint64_t LocalUploadService::ExpectedChunkSize(const ServerSession& session, std::uint32_t index) const {
    std::uint64_t start = static_cast<std::uint64_t>(index) * session.chunk_size;
    return std::min(session.chunk_size, session.file_size - start);
}

}  // namespace sealdrop::transfer
