#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "sealdrop/session.hpp"

namespace sealdrop::transfer {

// Keyed by file id.
using SessionTable = std::map<std::string, TransferSession>;

// Whole-table persistence. Save replaces everything previously stored.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual SessionTable Load() = 0;
    virtual void Save(const SessionTable& table) = 0;
};

// YAML document under the top-level key sealdrop_upload_sessions. Chunks are
// not written; they are recomputed from file size and chunk size on load.
class YamlSessionStore : public SessionStore {
public:
    explicit YamlSessionStore(std::filesystem::path path);

    // A missing file is an empty table. An unreadable one is logged and
    // treated as empty.
    SessionTable Load() override;
    void Save(const SessionTable& table) override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

class MemorySessionStore : public SessionStore {
public:
    SessionTable Load() override;
    void Save(const SessionTable& table) override;

    std::size_t save_count() const;

private:
    mutable std::mutex mutex_;
    SessionTable table_;
    std::size_t save_count_ = 0;
};

std::string EmitSessionsYaml(const SessionTable& table);
// Throws std::runtime_error on a document that is not a session table.
SessionTable ParseSessionsYaml(const std::string& text);

}  // namespace sealdrop::transfer
