#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

#include "sealdrop/constants.hpp"
#include "sealdrop/session_store.hpp"
#include "test_support.hpp"

using namespace sealdrop;
using namespace sealdrop::transfer;
using sealdrop::testing::check;
using sealdrop::testing::check_throws;

namespace {

TransferSession MakeSession(const std::string& name, SessionStatus status) {
    TransferSession session;
    session.file_name = name;
    session.file_size = 250;
    session.file_id = MakeFileId(name, session.file_size, 1700000000000);
    session.session_id = "sess-" + name;
    session.upload_id = "upload-" + name;
    session.content_type = "application/octet-stream";
    session.chunk_size = 100;
    session.chunks = CalculateChunks(session.file_size, session.chunk_size);
    session.total_chunks = static_cast<std::uint32_t>(session.chunks.size());
    session.ResetCompleted({0, 2});
    session.status = status;
    session.started_at = Clock::from_time_t(1714564800);
    session.expires_at = session.started_at + std::chrono::hours(24 * 7);
    session.metadata["clientEncrypted"] = "true";
    return session;
}

void TestYamlRoundTrip() {
    sealdrop::testing::TempDir dir("store");
    YamlSessionStore store(dir.path / "nested" / "sessions.yaml");
    check(store.Load().empty(), "missing file loads as empty");

    SessionTable table;
    TransferSession paused = MakeSession("a.sdx", SessionStatus::kPaused);
    paused.last_error = "Chunk 1 failed after 3 attempt(s): connection reset";
    table[paused.file_id] = paused;
    TransferSession idle = MakeSession("b.sdx", SessionStatus::kIdle);
    table[idle.file_id] = idle;
    store.Save(table);

    std::ifstream in(store.path());
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    check(text.find(std::string(constants::kStorageKey)) != std::string::npos, "document uses the storage key");

    SessionTable loaded = store.Load();
    check(loaded.size() == 1, "transient sessions are not persisted");
    auto it = loaded.find(paused.file_id);
    check(it != loaded.end(), "persisted session is found by file id");
    if (it == loaded.end()) {
        return;
    }
    const TransferSession& back = it->second;
    check(back.session_id == paused.session_id && back.upload_id == paused.upload_id, "ids survive");
    check(back.file_name == "a.sdx" && back.file_size == 250, "file fields survive");
    check(back.status == SessionStatus::kPaused, "status survives");
    check(back.completed_chunks == std::set<std::uint32_t>({0, 2}), "completed set survives");
    check(back.chunks.size() == 3 && back.chunks[0].uploaded && !back.chunks[1].uploaded && back.chunks[2].uploaded,
          "chunks are recomputed and marked");
    check(back.progress > 66.6 && back.progress < 66.7, "progress recomputed");
    check(back.started_at == paused.started_at && back.expires_at == paused.expires_at, "timestamps survive");
    check(back.metadata.at("clientEncrypted") == "true", "metadata survives");
    check(back.last_error == paused.last_error, "last error survives");
}

void TestCorruptFile() {
    sealdrop::testing::TempDir dir("corrupt");
    std::filesystem::path path = dir.path / "sessions.yaml";
    {
        std::ofstream out(path);
        out << "sealdrop_upload_sessions: [unclosed\n";
    }
    YamlSessionStore store(path);
    check(store.Load().empty(), "corrupt file loads as empty");

    check_throws<std::runtime_error>([] {
        ParseSessionsYaml("sealdrop_upload_sessions:\n  x:\n    sessionId: s\n    fileName: f\n    fileSize: 10\n"
                          "    chunkSize: 4\n    totalChunks: 2\n    status: paused\n"
                          "    startedAt: 2024-05-01T12:00:00Z\n    expiresAt: 2024-05-08T12:00:00Z\n");
    }, "inconsistent chunk count is rejected");
    check(ParseSessionsYaml("").empty(), "empty document is an empty table");
}

void TestMemoryStore() {
    MemorySessionStore store;
    SessionTable table;
    TransferSession active = MakeSession("m.sdx", SessionStatus::kActive);
    table[active.file_id] = active;
    store.Save(table);
    store.Save(table);
    check(store.save_count() == 2, "memory store counts saves");
    check(store.Load().size() == 1, "memory store returns what was saved");
    store.Save({});
    check(store.Load().empty(), "save replaces the whole table");
}

}  // namespace

int main() {
    TestYamlRoundTrip();
    TestCorruptFile();
    TestMemoryStore();
    return sealdrop::testing::finish("test_session_store");
}
