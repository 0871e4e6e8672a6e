#include "sealdrop/session_store.hpp"

#include "sealdrop/constants.hpp"
#include "sealdrop/file_stream.hpp"
#include "sealdrop/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sealdrop::transfer {

namespace {

void EmitSession(YAML::Emitter& out, const TransferSession& session) {
    out << YAML::BeginMap;
    out << YAML::Key << "fileId"        << YAML::Value << session.file_id;
    out << YAML::Key << "sessionId"     << YAML::Value << session.session_id;
    out << YAML::Key << "uploadId"      << YAML::Value << session.upload_id;
    out << YAML::Key << "fileName"      << YAML::Value << session.file_name;
    out << YAML::Key << "fileSize"      << YAML::Value << session.file_size;
    out << YAML::Key << "contentType"   << YAML::Value << session.content_type;
    out << YAML::Key << "chunkSize"     << YAML::Value << session.chunk_size;
    out << YAML::Key << "totalChunks"   << YAML::Value << session.total_chunks;

    out << YAML::Key << "completedChunks" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (std::uint32_t index : session.completed_chunks) {
        out << index;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "progress"  << YAML::Value << session.progress;
    out << YAML::Key << "status"    << YAML::Value << ToString(session.status);
    out << YAML::Key << "startedAt" << YAML::Value << FormatTimestamp(session.started_at);
    out << YAML::Key << "expiresAt" << YAML::Value << FormatTimestamp(session.expires_at);

    if (!session.metadata.empty()) {
        out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
        for (const auto& [key, value] : session.metadata) {
            out << YAML::Key << key << YAML::Value << value;
        }
        out << YAML::EndMap;
    }
    if (!session.last_error.empty()) {
        out << YAML::Key << "lastError" << YAML::Value << session.last_error;
    }
    out << YAML::EndMap;
}

TimePoint RequireTimestamp(const YAML::Node& node, const char* key) {
    std::string raw = node[key].as<std::string>("");
    auto parsed = ParseTimestamp(raw);
    if (!parsed) {
        throw std::runtime_error(std::string("Session field ") + key + " is not a timestamp");
    }
    return *parsed;
}

TransferSession ReadSession(const std::string& key, const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::runtime_error("Session entry is not a map: " + key);
    }
    TransferSession session;
    session.file_id = node["fileId"].as<std::string>(key);
    session.session_id = node["sessionId"].as<std::string>();
    session.upload_id = node["uploadId"].as<std::string>("");
    session.file_name = node["fileName"].as<std::string>();
    session.file_size = node["fileSize"].as<std::uint64_t>();
    session.content_type = node["contentType"].as<std::string>(std::string(constants::kDefaultContentType));
    session.chunk_size = node["chunkSize"].as<std::uint64_t>();
    session.total_chunks = node["totalChunks"].as<std::uint32_t>();

    session.chunks = CalculateChunks(session.file_size, session.chunk_size);
    if (session.chunks.size() != session.total_chunks) {
        throw std::runtime_error("Session " + key + " has an inconsistent chunk count");
    }

    std::set<std::uint32_t> completed;
    if (const YAML::Node list = node["completedChunks"]) {
        for (const auto& item : list) {
            completed.insert(item.as<std::uint32_t>());
        }
    }
    session.ResetCompleted(completed);

    session.status = StatusFromString(node["status"].as<std::string>("active"));
    session.started_at = RequireTimestamp(node, "startedAt");
    session.expires_at = RequireTimestamp(node, "expiresAt");

    if (const YAML::Node meta = node["metadata"]) {
        for (const auto& entry : meta) {
            session.metadata[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    session.last_error = node["lastError"].as<std::string>("");
    return session;
}

}  // namespace

std::string EmitSessionsYaml(const SessionTable& table) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << std::string(constants::kStorageKey) << YAML::Value;
    out << YAML::BeginMap;
    for (const auto& [file_id, session] : table) {
        if (!IsPersistable(session.status)) {
            continue;
        }
        out << YAML::Key << file_id << YAML::Value;
        EmitSession(out, session);
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    if (!out.good()) {
        throw std::runtime_error("Failed to emit session table: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

SessionTable ParseSessionsYaml(const std::string& text) {
    SessionTable table;
    YAML::Node doc;
    try {
        doc = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Session table is not valid YAML: ") + e.what());
    }
    if (!doc || doc.IsNull()) {
        return table;
    }
    if (!doc.IsMap()) {
        throw std::runtime_error("Session state is not a YAML map");
    }
    const YAML::Node sessions = doc[std::string(constants::kStorageKey)];
    if (!sessions || sessions.IsNull()) {
        return table;
    }
    if (!sessions.IsMap()) {
        throw std::runtime_error("Session table is not a map");
    }
    try {
        for (const auto& entry : sessions) {
            std::string key = entry.first.as<std::string>();
            TransferSession session = ReadSession(key, entry.second);
            if (!IsPersistable(session.status)) {
                continue;
            }
            table.emplace(key, std::move(session));
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Session table entry is malformed: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Session table entry is malformed: ") + e.what());
    }
    return table;
}

YamlSessionStore::YamlSessionStore(std::filesystem::path path) : path_(std::move(path)) {}

SessionTable YamlSessionStore::Load() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return {};
    }
    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        log::Warn("Cannot open session state " + path_.string() + "; starting empty");
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    try {
        return ParseSessionsYaml(buffer.str());
    } catch (const std::runtime_error& e) {
        log::Warn("Ignoring unreadable session state " + path_.string() + ": " + e.what());
        return {};
    }
}

void YamlSessionStore::Save(const SessionTable& table) {
    std::string text = EmitSessionsYaml(table);
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }
    filestream::WriteFileAtomic(path_, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

SessionTable MemorySessionStore::Load() {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionTable copy;
    for (const auto& [key, session] : table_) {
        if (IsPersistable(session.status)) {
            copy.emplace(key, session);
        }
    }
    return copy;
}

void MemorySessionStore::Save(const SessionTable& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    table_.clear();
    for (const auto& [key, session] : table) {
        if (IsPersistable(session.status)) {
            table_.emplace(key, session);
        }
    }
    ++save_count_;
}

std::size_t MemorySessionStore::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}

}  // namespace sealdrop::transfer
