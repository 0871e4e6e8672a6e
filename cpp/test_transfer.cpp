#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "sealdrop/errors.hpp"
#include "sealdrop/session_store.hpp"
#include "sealdrop/transfer_manager.hpp"
#include "test_support.hpp"

using namespace sealdrop;
using namespace sealdrop::transfer;
using sealdrop::testing::check;
using sealdrop::testing::check_throws;
using std::chrono::milliseconds;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

struct Rig {
    explicit Rig(std::uint64_t chunk_size) : api(clock, chunk_size) {}

    TransferConfig Config(std::size_t concurrency = 3) {
        TransferConfig config;
        config.max_concurrency = concurrency;
        config.retry = RetryPolicy(3, milliseconds(1000));
        config.sleep = sleeper.fn();
        config.now = clock.fn();
        return config;
    }

    sealdrop::testing::ManualClock clock;
    sealdrop::testing::RecordingSleeper sleeper;
    sealdrop::testing::FakeUploadApi api;
    sealdrop::testing::FakeTransport transport;
    MemorySessionStore store;
};

FileHandle Handle(const std::string& name, std::uint64_t size) {
    FileHandle handle;
    handle.name = name;
    handle.size = size;
    handle.last_modified_ms = 1700000000000;
    handle.content_type = "application/x-sealdrop";
    handle.source = std::make_shared<sealdrop::testing::PatternSource>(size);
    return handle;
}

void TestLargeFileWithFlakyChunk() {
    Rig rig(100 * kMiB);
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config());
    FileHandle file = Handle("encrypted_0001.sdx", 250 * kMiB);

    TransferSession session = manager.InitiateUpload(file);
    check(session.total_chunks == 3, "250 MiB splits into 3 chunks");
    check(session.status == SessionStatus::kActive, "initiated session is active");
    check(session.file_id == "encrypted_0001.sdx_262144000_1700000000000", "session keyed by file id");
    check(rig.store.Load().count(session.file_id) == 1, "session persisted right after initiate");

    rig.transport.failures[1] = 2;
    std::vector<UploadProgress> reports;
    auto result = manager.UploadFile(session.file_id, UploadOptions{},
                                     [&](const UploadProgress& p) { reports.push_back(p); });

    check(result.has_value(), "upload completes");
    check(result && result->retrieval_code == "CODE1", "retrieval code returned");
    check(rig.api.complete_calls == 1, "complete called exactly once");
    check(rig.transport.PutCount(0) == 1 && rig.transport.PutCount(2) == 1, "healthy chunks sent once");
    check(rig.transport.PutCount(1) == 3, "flaky chunk sent three times");
    auto delays = rig.sleeper.delays();
    check(delays.size() == 2 && delays[0] == milliseconds(1000) && delays[1] == milliseconds(2000),
          "backoff 1s then 2s");
    check(rig.transport.bad_ranges.empty(), "every chunk carried its own bytes");
    check(rig.transport.ranges[2].first == 200 * kMiB && rig.transport.ranges[2].second == 50 * kMiB,
          "last chunk range is exact");
    check(rig.transport.last_content_type == "application/x-sealdrop", "content type forwarded");
    check(rig.api.Etag(session.session_id, 0) == "etag-0", "quotes stripped from etag");
    check(rig.api.last_options.expiration_hours == 24, "default options sent");

    check(reports.size() == 3, "one progress report per chunk");
    bool monotonic = true;
    for (std::size_t i = 1; i < reports.size(); ++i) {
        monotonic = monotonic && reports[i].completed_chunks == reports[i - 1].completed_chunks + 1 &&
                    reports[i].uploaded_bytes > reports[i - 1].uploaded_bytes &&
                    reports[i].progress > reports[i - 1].progress;
    }
    check(monotonic, "progress is monotonic");
    check(!reports.empty() && reports.back().uploaded_bytes == 250 * kMiB, "uploaded bytes end at file size");
    check(!reports.empty() && reports.back().progress == 100.0, "progress ends at 100");
    check(!reports.empty() && reports.back().total_bytes == 250 * kMiB, "total bytes reported");

    check(!manager.GetSession(session.file_id), "completed session purged from memory");
    check(rig.store.Load().empty(), "completed session purged from store");
    check(rig.store.save_count() >= 5, "store written on every state change");
}

void TestExhaustionThenResume() {
    Rig rig(100);
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config(1));
    FileHandle file = Handle("encrypted_0002.sdx", 450);
    TransferSession session = manager.InitiateUpload(file);
    check(session.total_chunks == 5, "450 bytes in 100 byte chunks gives 5");

    rig.transport.failures[1] = 100;
    bool threw = false;
    try {
        manager.UploadFile(session.file_id, UploadOptions{});
    } catch (const ChunkUploadFailed& e) {
        threw = true;
        check(e.chunk_index() && *e.chunk_index() == 1, "failure names the chunk");
        check(e.attempts() == 3, "failure counts three attempts");
        check(e.file_id() == session.file_id, "failure names the file");
        check(e.cause() == "connection reset", "failure keeps the cause");
    }
    check(threw, "exhausted retries raise ChunkUploadFailed");
    check(rig.transport.PutCount(2) == 0 && rig.transport.PutCount(4) == 0, "no new chunk starts after a failure");
    check(rig.api.complete_calls == 0, "no completion after a failure");
    auto stored = manager.GetSession(session.file_id);
    check(stored && stored->status == SessionStatus::kError, "session marked error");
    check(stored && !stored->last_error.empty(), "error message recorded");
    check(stored && stored->completed_chunks == std::set<std::uint32_t>({0}), "finished chunk kept");
    check(rig.store.Load().at(session.file_id).status == SessionStatus::kError, "error status persisted");

    rig.transport.failures[1] = 0;
    TransferSession resumed = manager.ResumeUpload(session.file_id, file);
    check(resumed.completed_chunks.size() == 1, "resume sees one finished chunk");
    auto result = manager.UploadFile(session.file_id, UploadOptions{});
    check(result.has_value(), "resumed upload completes");
    check(rig.transport.PutCount(0) == 1, "finished chunk not sent again");
    check(rig.api.complete_calls == 1, "exactly one completion across attempts");

    check_throws<SessionExpired>([&] { manager.UploadFile(session.file_id, UploadOptions{}); },
                                 "a finished upload cannot be completed twice");
    check_throws<SessionExpired>([&] { manager.ResumeUpload(session.file_id, file); },
                                 "a finished upload cannot be resumed");
    check(rig.api.complete_calls == 1, "still exactly one completion");
}

void TestBoundedConcurrency() {
    Rig rig(100);
    rig.transport.hold_ms = 20;
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config(3));
    TransferSession session = manager.InitiateUpload(Handle("encrypted_0003.sdx", 1000));

    std::vector<std::uint32_t> completed_counts;
    auto result = manager.UploadFile(session.file_id, UploadOptions{}, [&](const UploadProgress& p) {
        completed_counts.push_back(p.completed_chunks);
    });
    check(result.has_value(), "parallel upload completes");
    check(rig.transport.max_active() <= 3, "never more than three transfers at once");
    check(rig.transport.max_active() >= 1, "transfers happened");
    check(completed_counts.size() == 10, "one report per chunk under concurrency");
    check(std::is_sorted(completed_counts.begin(), completed_counts.end()), "reports never go backwards");

    Rig serial(100);
    serial.transport.hold_ms = 5;
    TransferManager one(serial.api, serial.transport, serial.store, serial.Config(1));
    TransferSession s = one.InitiateUpload(Handle("encrypted_0004.sdx", 500));
    one.UploadFile(s.file_id, UploadOptions{});
    check(serial.transport.max_active() == 1, "concurrency of one is serial");
}

void TestAlreadyUploadedAndEtagFallback() {
    Rig rig(100);
    rig.transport.empty_etag = true;
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config(1));
    TransferSession session = manager.InitiateUpload(Handle("encrypted_0005.sdx", 300));
    rig.api.MarkCompleted(session.session_id, 0);

    std::vector<UploadProgress> reports;
    auto result = manager.UploadFile(session.file_id, UploadOptions{},
                                     [&](const UploadProgress& p) { reports.push_back(p); });
    check(result.has_value(), "upload completes");
    check(rig.transport.PutCount(0) == 0, "already uploaded chunk skipped");
    check(rig.api.complete_chunk_calls == 2, "only transferred chunks are confirmed");
    check(reports.size() == 3, "skipped chunk still reported");
    check(rig.api.Etag(session.session_id, 1) == "chunk-1", "missing etag falls back to chunk-<index>");
}

void TestRestartReconcilesWithServer() {
    Rig rig(100);
    FileHandle file = Handle("encrypted_0006.sdx", 450);
    std::string file_id;
    std::string session_id;
    {
        TransferManager first(rig.api, rig.transport, rig.store, rig.Config(1));
        TransferSession session = first.InitiateUpload(file);
        file_id = session.file_id;
        session_id = session.session_id;
        rig.transport.failures[2] = 100;
        check_throws<ChunkUploadFailed>([&] { first.UploadFile(file_id, UploadOptions{}); }, "first run fails");
    }
    rig.transport.failures[2] = 0;
    rig.api.sessions[session_id].completed = {0, 3};

    TransferManager second(rig.api, rig.transport, rig.store, rig.Config(1));
    IncompleteUpload found = second.CheckIncompleteUpload(file);
    check(found.exists, "restart finds the incomplete upload");
    check(found.completed_chunks == 2 && found.total_chunks == 5, "server counts win");
    check(found.session && found.session->session_id == session_id, "same server session");

    TransferSession resumed = second.ResumeUpload(file_id, file);
    check(resumed.completed_chunks == std::set<std::uint32_t>({0, 3}), "server set replaces local set");
    check(resumed.progress == 40.0, "progress recomputed from server set");

    auto result = second.UploadFile(file_id, UploadOptions{});
    check(result.has_value(), "restarted upload completes");
    check(rig.transport.PutCount(1) == 2, "chunk the server lost is sent again");
    check(rig.transport.PutCount(3) == 0, "chunk the server has is never sent");
    check(rig.api.complete_calls == 1, "one completion after restart");
}

void TestCheckIncomplete() {
    Rig rig(100);
    FileHandle file = Handle("encrypted_0007.sdx", 250);
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config());
    check(!manager.CheckIncompleteUpload(file).exists, "nothing to resume at first");

    TransferSession session = manager.InitiateUpload(file);
    rig.api.fail_list = true;
    check(!manager.CheckIncompleteUpload(file).exists, "unreachable server reports nothing to resume");
    check(manager.GetSession(session.file_id).has_value(), "unreachable server keeps local state");

    rig.api.fail_list = false;
    check(manager.CheckIncompleteUpload(file).exists, "known session is resumable");

    rig.api.Forget(session.session_id);
    check(!manager.CheckIncompleteUpload(file).exists, "session unknown to server is absent");
    check(!manager.GetSession(session.file_id).has_value(), "session unknown to server dropped locally");
    check_throws<SessionExpired>([&] { manager.ResumeUpload(session.file_id, file); }, "dropped session cannot resume");
}

void TestExpiry() {
    Rig rig(100);
    FileHandle file = Handle("encrypted_0008.sdx", 250);
    std::string file_id;
    {
        TransferManager manager(rig.api, rig.transport, rig.store, rig.Config());
        file_id = manager.InitiateUpload(file).file_id;
        rig.clock.Advance(std::chrono::hours(24 * 7 + 1));
        check_throws<SessionExpired>([&] { manager.UploadFile(file_id, UploadOptions{}); },
                                     "expired session cannot upload");
        check(!manager.GetSession(file_id).has_value(), "expired session dropped");
    }

    Rig again(100);
    {
        TransferManager manager(again.api, again.transport, again.store, again.Config());
        manager.InitiateUpload(file);
    }
    again.clock.Advance(std::chrono::hours(24 * 8));
    TransferManager reloaded(again.api, again.transport, again.store, again.Config());
    check(reloaded.GetAllSessions().empty(), "expired sessions pruned on load");
    check(again.store.Load().empty(), "pruning is persisted");
}

void TestCancel() {
    Rig rig(100);
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config(1));
    TransferSession session = manager.InitiateUpload(Handle("encrypted_0009.sdx", 500));
    rig.transport.on_put = [&](std::uint32_t index) {
        if (index == 1) {
            manager.Cancel(session.file_id);
        }
    };
    check_throws<SessionCancelled>([&] { manager.UploadFile(session.file_id, UploadOptions{}); },
                                   "running upload reports cancellation");
    check(rig.api.cancel_calls == 1, "server told about cancellation");
    check(rig.transport.PutCount(2) == 0, "no chunk starts after cancel");
    check(!manager.GetSession(session.file_id).has_value(), "cancelled session removed");
    check(rig.store.Load().empty(), "cancelled session removed from store");
    check(rig.api.complete_calls == 0, "cancelled upload never completes");

    rig.transport.on_put = nullptr;
    TransferSession other = manager.InitiateUpload(Handle("encrypted_0010.sdx", 200));
    rig.api.fail_cancel = true;
    manager.Cancel(other.file_id);
    check(rig.api.cancel_calls == 2, "cancel attempted on server");
    check(!manager.GetSession(other.file_id).has_value(), "failed server cancel still clears local state");
}

void TestPauseAndResume() {
    Rig rig(100);
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config(1));
    TransferSession session = manager.InitiateUpload(Handle("encrypted_0011.sdx", 500));
    rig.transport.on_put = [&](std::uint32_t index) {
        if (index == 1) {
            manager.Pause(session.file_id);
        }
    };
    auto paused = manager.UploadFile(session.file_id, UploadOptions{});
    check(!paused.has_value(), "paused upload returns no result");
    auto snapshot = manager.GetSession(session.file_id);
    check(snapshot && snapshot->status == SessionStatus::kPaused, "status is paused");
    check(snapshot && snapshot->completed_chunks == std::set<std::uint32_t>({0, 1}), "in-flight chunk still counts");
    check(rig.transport.PutCount(2) == 0, "no new chunk after pause");
    check(rig.store.Load().at(session.file_id).status == SessionStatus::kPaused, "pause persisted");

    rig.transport.on_put = nullptr;
    auto done = manager.UploadFile(session.file_id, UploadOptions{});
    check(done.has_value(), "upload continues after pause");
    check(rig.transport.TotalPuts() == 5, "each chunk sent once across pause");
    check(rig.api.complete_calls == 1, "one completion across pause");
}

void TestOffline() {
    Rig rig(100);
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config(1));
    TransferSession session = manager.InitiateUpload(Handle("encrypted_0012.sdx", 300));

    manager.SetOnline(false);
    check(!manager.online(), "manager reports offline");
    check(!manager.UploadFile(session.file_id, UploadOptions{}).has_value(), "offline upload pauses at once");
    check(rig.transport.TotalPuts() == 0, "nothing sent while offline");

    manager.SetOnline(true);
    rig.transport.on_put = [&](std::uint32_t index) {
        if (index == 0) {
            manager.SetOnline(false);
        }
    };
    check(!manager.UploadFile(session.file_id, UploadOptions{}).has_value(), "going offline pauses");
    auto snapshot = manager.GetSession(session.file_id);
    check(snapshot && snapshot->status == SessionStatus::kPaused, "offline leaves session paused");

    rig.transport.on_put = nullptr;
    manager.SetOnline(true);
    check(manager.UploadFile(session.file_id, UploadOptions{}).has_value(), "explicit resume after reconnect");
}

void TestValidationAndMismatch() {
    Rig rig(100);
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config());
    FileHandle file = Handle("encrypted_0013.sdx", 250);
    TransferSession session = manager.InitiateUpload(file);

    UploadOptions too_short;
    too_short.expiration_hours = 0;
    check_throws<std::invalid_argument>([&] { manager.UploadFile(session.file_id, too_short); },
                                        "zero expiration rejected");
    UploadOptions too_long;
    too_long.expiration_hours = 721;
    check_throws<std::invalid_argument>([&] { manager.UploadFile(session.file_id, too_long); },
                                        "expiration over 720 hours rejected");
    check(rig.transport.TotalPuts() == 0, "validation happens before any transfer");

    FileHandle other = Handle("encrypted_other.sdx", 250);
    check_throws<TransferError>([&] { manager.ResumeUpload(session.file_id, other); },
                                "resume with a different file rejected");
    FileHandle unknown = Handle("nope", 1);
    check_throws<SessionExpired>([&] { manager.ResumeUpload(unknown.FileId(), unknown); },
                                 "unknown id cannot resume");

    rig.api.total_chunks_override = 7;
    check_throws<TransferError>([&] { manager.InitiateUpload(Handle("encrypted_0014.sdx", 250)); },
                                "chunk count disagreement rejected");

    FileHandle lying = Handle("encrypted_0015.sdx", 250);
    lying.size = 300;
    check_throws<std::invalid_argument>([&] { manager.InitiateUpload(lying); }, "size must match source");
}

void TestCompleteFailure() {
    Rig rig(100);
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config());
    TransferSession session = manager.InitiateUpload(Handle("encrypted_0016.sdx", 250));
    rig.api.fail_complete = true;
    bool plain_transfer_error = false;
    try {
        manager.UploadFile(session.file_id, UploadOptions{});
    } catch (const ChunkUploadFailed&) {
    } catch (const TransferError& e) {
        plain_transfer_error = !e.chunk_index().has_value();
    }
    check(plain_transfer_error, "finalize failure is a TransferError without a chunk");
    auto snapshot = manager.GetSession(session.file_id);
    check(snapshot && snapshot->status == SessionStatus::kError, "finalize failure marks error");

    rig.api.fail_complete = false;
    UploadOptions options;
    options.expiration_hours = 72;
    options.max_downloads = 5;
    options.description = "quarterly";
    options.is_public = true;
    auto result = manager.UploadFile(session.file_id, options);
    check(result.has_value(), "retrying finalize succeeds");
    check(rig.transport.TotalPuts() == 3, "chunks are not re-sent for finalize retry");
    check(rig.api.last_options.expiration_hours == 72 && rig.api.last_options.max_downloads == 5u &&
              rig.api.last_options.description == std::string("quarterly") && rig.api.last_options.is_public,
          "options record forwarded");
}

void TestCompletedEntriesDroppedOnLoad() {
    Rig rig(100);
    SessionTable table;
    TransferSession done;
    done.file_id = "done_1_1";
    done.session_id = "s";
    done.file_name = "done";
    done.file_size = 100;
    done.chunk_size = 100;
    done.chunks = CalculateChunks(100, 100);
    done.total_chunks = 1;
    done.ResetCompleted({0});
    done.status = SessionStatus::kCompleted;
    done.expires_at = rig.clock.now() + std::chrono::hours(1);
    table[done.file_id] = done;
    TransferSession open = done;
    open.file_id = "open_1_1";
    open.ResetCompleted({});
    open.status = SessionStatus::kPaused;
    table[open.file_id] = open;
    rig.store.Save(table);

    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config());
    auto all = manager.GetAllSessions();
    check(all.size() == 1 && all[0].file_id == "open_1_1", "completed entry dropped on load");
    check(rig.store.Load().count("done_1_1") == 0, "dropping completed entry persisted");
    check(rig.store.Load().count("open_1_1") == 1, "open session kept");
}

void TestCollaboratorFailuresCarryFileId() {
    Rig rig(100);
    TransferManager manager(rig.api, rig.transport, rig.store, rig.Config());
    FileHandle file = Handle("encrypted_0018.sdx", 250);

    rig.api.fail_initiate = true;
    bool wrapped = false;
    try {
        manager.InitiateUpload(file);
    } catch (const ChunkUploadFailed&) {
    } catch (const TransferError& e) {
        wrapped = e.file_id() == file.FileId() && !e.chunk_index() &&
                  std::string(e.what()).find("service unavailable") != std::string::npos;
    }
    check(wrapped, "failed initiate is a TransferError with the file id and cause");
    check(!manager.GetSession(file.FileId()).has_value(), "failed initiate leaves no session");

    rig.api.fail_initiate = false;
    TransferSession session = manager.InitiateUpload(file);
    rig.api.fail_list = true;
    wrapped = false;
    try {
        manager.ResumeUpload(session.file_id, file);
    } catch (const SessionExpired&) {
    } catch (const TransferError& e) {
        wrapped = e.file_id() == session.file_id && !e.chunk_index() &&
                  std::string(e.what()).find("network unreachable") != std::string::npos;
    }
    check(wrapped, "failed session check on resume is a TransferError with the file id and cause");
    check(manager.GetSession(session.file_id).has_value(), "unreachable server keeps the session");
}

void TestPauseDuringBackoff() {
    Rig rig(100);
    TransferManager* running = nullptr;
    std::string file_id;
    int sleeps = 0;
    TransferConfig config = rig.Config(1);
    config.sleep = [&](std::chrono::milliseconds) {
        ++sleeps;
        if (running) {
            running->Pause(file_id);
        }
    };
    TransferManager manager(rig.api, rig.transport, rig.store, config);
    file_id = manager.InitiateUpload(Handle("encrypted_0019.sdx", 300)).file_id;
    running = &manager;
    rig.transport.failures[0] = 1;

    auto paused = manager.UploadFile(file_id, UploadOptions{});
    check(!paused.has_value(), "pause during backoff returns no result");
    check(sleeps == 1, "one backoff sleep");
    check(rig.transport.PutCount(0) == 1, "no retry attempt after a pause during backoff");
    check(rig.transport.TotalPuts() == 1, "no other chunk started");
    auto snapshot = manager.GetSession(file_id);
    check(snapshot && snapshot->status == SessionStatus::kPaused, "session paused");
    check(snapshot && snapshot->completed_chunks.empty(), "nothing completed");

    running = nullptr;
    check(manager.UploadFile(file_id, UploadOptions{}).has_value(), "upload completes after resume");
    check(rig.transport.PutCount(0) == 2, "interrupted chunk sent again on resume");
}

}  // namespace

int main() {
    TestLargeFileWithFlakyChunk();
    TestExhaustionThenResume();
    TestBoundedConcurrency();
    TestAlreadyUploadedAndEtagFallback();
    TestRestartReconcilesWithServer();
    TestCheckIncomplete();
    TestExpiry();
    TestCancel();
    TestPauseAndResume();
    TestOffline();
    TestValidationAndMismatch();
    TestCompleteFailure();
    TestCompletedEntriesDroppedOnLoad();
    TestCollaboratorFailuresCarryFileId();
    TestPauseDuringBackoff();
    return sealdrop::testing::finish("test_transfer");
}
