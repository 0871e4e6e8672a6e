#include "sealdrop/cli_colors.hpp"
#include "sealdrop/config.hpp"
#include "sealdrop/constants.hpp"
#include "sealdrop/crypto.hpp"
#include "sealdrop/envelope.hpp"
#include "sealdrop/errors.hpp"
#include "sealdrop/file_stream.hpp"
#include "sealdrop/local_service.hpp"
#include "sealdrop/log.hpp"
#include "sealdrop/password.hpp"
#include "sealdrop/session_store.hpp"
#include "sealdrop/transfer_manager.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

namespace fs = std::filesystem;
namespace transfer = sealdrop::transfer;

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitPaused = 3;

std::atomic<bool> g_interrupted{false};

void HandleInterrupt(int) {
    g_interrupted.store(true);
}

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  sealdrop encrypt <file> [-p <password>] [--out <path>] [--allow-weak]\n";
    std::cout << "  sealdrop decrypt <file.sdx> -p <password> [--out <path>]\n";
    std::cout << "  sealdrop info <file.sdx>\n";
    std::cout << "  sealdrop strength <password>\n";
    std::cout << "  sealdrop genpass [--length <n>]\n";
    std::cout << "  sealdrop upload <file> --target <dir> [-p <password>] [--allow-weak] [--expires-hours <n>]\n";
    std::cout << "                  [--max-downloads <n>] [--description <text>] [--public] [--concurrency <n>]\n";
    std::cout << "                  [--state <path>]\n";
    std::cout << "  sealdrop sessions [--state <path>]\n";
    std::cout << "  sealdrop cancel <fileId> --target <dir> [--state <path>]\n";
}

std::uint64_t ParseCount(const std::string& flag, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError("Invalid value for " + flag + ": " + value);
    }
    if (consumed != value.size() || parsed == 0) {
        throw UsageError("Invalid value for " + flag + ": " + value);
    }
    return parsed;
}

const char* RequireValue(int argc, char** argv, int idx, const char* what) {
    if (idx + 1 >= argc) {
        throw UsageError(std::string("Missing ") + what + " value");
    }
    return argv[idx + 1];
}

struct CodecArgs {
    std::string input;
    std::string output;
    std::string password;
    bool allow_weak = false;
};

CodecArgs ParseCodecArgs(int argc, char** argv, int start_index) {
    CodecArgs opts;
    if (start_index >= argc) {
        throw UsageError("Missing input path");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-p" || flag == "--password") {
            opts.password = RequireValue(argc, argv, idx, "password");
            idx += 2;
        } else if (flag == "--out" || flag == "-o") {
            opts.output = RequireValue(argc, argv, idx, "output path");
            idx += 2;
        } else if (flag == "--allow-weak") {
            opts.allow_weak = true;
            idx += 1;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    return opts;
}

struct UploadArgs {
    std::string input;
    std::string target;
    std::string password;
    std::string state;
    bool allow_weak = false;
    std::optional<std::size_t> concurrency;
    transfer::UploadOptions options;
};

UploadArgs ParseUploadArgs(int argc, char** argv, int start_index) {
    UploadArgs opts;
    if (start_index >= argc) {
        throw UsageError("Missing input path");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-p" || flag == "--password") {
            opts.password = RequireValue(argc, argv, idx, "password");
            idx += 2;
        } else if (flag == "--target") {
            opts.target = RequireValue(argc, argv, idx, "target directory");
            idx += 2;
        } else if (flag == "--state") {
            opts.state = RequireValue(argc, argv, idx, "state path");
            idx += 2;
        } else if (flag == "--allow-weak") {
            opts.allow_weak = true;
            idx += 1;
        } else if (flag == "--expires-hours") {
            opts.options.expiration_hours =
                static_cast<std::uint32_t>(ParseCount(flag, RequireValue(argc, argv, idx, "expiration")));
            idx += 2;
        } else if (flag == "--max-downloads") {
            opts.options.max_downloads =
                static_cast<std::uint32_t>(ParseCount(flag, RequireValue(argc, argv, idx, "download limit")));
            idx += 2;
        } else if (flag == "--description") {
            opts.options.description = std::string(RequireValue(argc, argv, idx, "description"));
            idx += 2;
        } else if (flag == "--public") {
            opts.options.is_public = true;
            idx += 1;
        } else if (flag == "--concurrency") {
            opts.concurrency = static_cast<std::size_t>(ParseCount(flag, RequireValue(argc, argv, idx, "concurrency")));
            idx += 2;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (opts.target.empty()) {
        throw UsageError("Missing --target directory");
    }
    try {
        opts.options.Validate();
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }
    return opts;
}

struct StateArgs {
    std::string subject;
    std::string target;
    std::string state;
};

StateArgs ParseStateArgs(int argc, char** argv, int start_index, bool needs_subject) {
    StateArgs opts;
    int idx = start_index;
    if (needs_subject) {
        if (idx >= argc) {
            throw UsageError("Missing file id");
        }
        opts.subject = argv[idx++];
    }
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--target") {
            opts.target = RequireValue(argc, argv, idx, "target directory");
            idx += 2;
        } else if (flag == "--state") {
            opts.state = RequireValue(argc, argv, idx, "state path");
            idx += 2;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    return opts;
}

transfer::ClientSettings ResolveSettings(const std::string& state_override) {
    transfer::ClientSettings settings = transfer::ClientSettings::FromEnvironment();
    if (!state_override.empty()) {
        settings.state_file = state_override;
    }
    sealdrop::log::SetVerbose(settings.verbose);
    return settings;
}

// Either checks a user supplied password or makes one up. Returns true when
// the password was generated.
bool ResolvePassword(std::string& password, bool allow_weak) {
    if (password.empty()) {
        password = sealdrop::password::GenerateSecurePassword();
        return true;
    }
    int score = sealdrop::password::EstimateStrength(password);
    if (!allow_weak && score < sealdrop::constants::kMinPasswordStrength) {
        throw std::runtime_error("Password is too weak (" + std::string(sealdrop::password::StrengthLabel(score)) +
                                 ", score " + std::to_string(score) + "); use --allow-weak or omit -p");
    }
    return false;
}

void PrintGeneratedPassword(const std::string& password) {
    std::cout << sealdrop::cli::BoldYellow("Generated password: ") << password << "\n";
    std::cout << "Keep it safe; the file cannot be recovered without it.\n";
}

class PercentPrinter {
public:
    explicit PercentPrinter(std::string label) : label_(std::move(label)) {}
    ~PercentPrinter() {
        if (last_ >= 0) {
            std::cerr << "\n";
        }
    }

    void operator()(double fraction) {
        int percent = static_cast<int>(fraction * 100.0);
        if (percent == last_) {
            return;
        }
        last_ = percent;
        std::cerr << "\r" << label_ << ": " << std::setw(3) << percent << "%" << std::flush;
    }

private:
    std::string label_;
    int last_ = -1;
};

std::string HumanSize(std::uint64_t bytes) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << kUnits[unit];
    return out.str();
}

fs::path SpoolDir(const transfer::ClientSettings& settings) {
    fs::path parent = settings.state_file.parent_path();
    return (parent.empty() ? fs::path(".") : parent) / "spool";
}

// Stable per input file, reveals nothing about its name.
fs::path SpoolPath(const transfer::ClientSettings& settings, const fs::path& input) {
    transfer::FileHandle current = transfer::OpenFileHandle(input);
    std::string identity = fs::absolute(input).lexically_normal().string() + "|" + std::to_string(current.size) + "|" +
                           std::to_string(current.last_modified_ms);
    std::string digest = sealdrop::crypto::Sha256Hex(sealdrop::crypto::Bytes(identity.begin(), identity.end()));
    return SpoolDir(settings) / ("encrypted_" + digest.substr(0, 16) + std::string(sealdrop::constants::kEnvelopeExt));
}

int RunEncrypt(int argc, char** argv) {
    CodecArgs opts = ParseCodecArgs(argc, argv, 2);
    bool generated = ResolvePassword(opts.password, opts.allow_weak);
    fs::path output = opts.output.empty() ? fs::path(opts.input + std::string(sealdrop::constants::kEnvelopeExt))
                                          : fs::path(opts.output);
    {
        PercentPrinter progress("Encrypting");
        sealdrop::envelope::EncryptFileTo(opts.input, output, opts.password, std::ref(progress));
    }
    std::cout << sealdrop::cli::Green("Encrypted: ") << output.string() << "\n";
    if (generated) {
        PrintGeneratedPassword(opts.password);
    }
    return kExitOk;
}

int RunDecrypt(int argc, char** argv) {
    CodecArgs opts = ParseCodecArgs(argc, argv, 2);
    if (opts.password.empty()) {
        throw UsageError("Password is required for decrypt");
    }
    fs::path written;
    {
        PercentPrinter progress("Decrypting");
        written = sealdrop::envelope::DecryptFileTo(opts.input, opts.output, opts.password, std::ref(progress));
    }
    std::cout << sealdrop::cli::Green("Decrypted: ") << written.string() << "\n";
    return kExitOk;
}

int RunInfo(int argc, char** argv) {
    if (argc < 3) {
        throw UsageError("Missing input path");
    }
    auto data = sealdrop::filestream::ReadFile(argv[2]);
    auto layout = sealdrop::envelope::Inspect(data);
    std::cout << "envelope_len: " << layout.total_len << " bytes\n";
    std::cout << "salt_len: " << sealdrop::constants::kSaltLen << " bytes\n";
    std::cout << "metadata_offset: " << layout.metadata_offset << "\n";
    std::cout << "metadata_len: " << layout.metadata_len << " bytes\n";
    std::cout << "payload_offset: " << layout.payload_offset << "\n";
    std::cout << "payload_len: " << layout.payload_len << " bytes\n";
    std::cout << "plaintext_len: " << (layout.payload_len - sealdrop::constants::kAeadTagLen) << " bytes\n";
    return kExitOk;
}

int RunStrength(int argc, char** argv) {
    if (argc < 3) {
        throw UsageError("Missing password");
    }
    int score = sealdrop::password::EstimateStrength(argv[2]);
    std::string label = sealdrop::password::StrengthLabel(score);
    std::string shown = score < sealdrop::constants::kMinPasswordStrength ? sealdrop::cli::Red(label)
                        : score < 60                                     ? sealdrop::cli::Yellow(label)
                                                                         : sealdrop::cli::Green(label);
    std::cout << score << "/100 " << shown << "\n";
    return kExitOk;
}

int RunGenpass(int argc, char** argv) {
    std::size_t length = sealdrop::constants::kGeneratedPasswordLen;
    int idx = 2;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--length") {
            length = static_cast<std::size_t>(ParseCount(flag, RequireValue(argc, argv, idx, "length")));
            idx += 2;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    std::cout << sealdrop::password::GenerateSecurePassword(length) << "\n";
    return kExitOk;
}

int RunUpload(int argc, char** argv) {
    UploadArgs opts = ParseUploadArgs(argc, argv, 2);
    transfer::ClientSettings settings = ResolveSettings(opts.state);
    if (opts.concurrency) {
        settings.max_concurrency = *opts.concurrency;
    }
    sealdrop::envelope::EnsureCryptoSupport();

    transfer::YamlSessionStore store(settings.state_file);
    transfer::LocalUploadService service(opts.target);
    transfer::TransferManager manager(service, service, store, settings.ToTransferConfig());

    const fs::path spool = SpoolPath(settings, opts.input);
    std::optional<std::string> file_id;
    transfer::FileHandle handle;
    std::error_code ec;
    if (fs::exists(spool, ec)) {
        handle = transfer::OpenFileHandle(spool);
        transfer::IncompleteUpload previous = manager.CheckIncompleteUpload(handle);
        if (previous.exists) {
            manager.ResumeUpload(handle.FileId(), handle);
            file_id = handle.FileId();
            std::cout << "Resuming upload: " << previous.completed_chunks << "/" << previous.total_chunks
                      << " chunks already stored\n";
        }
    }

    bool generated = false;
    if (!file_id) {
        generated = ResolvePassword(opts.password, opts.allow_weak);
        fs::create_directories(spool.parent_path());
        {
            PercentPrinter progress("Encrypting");
            sealdrop::envelope::EncryptFileTo(opts.input, spool, opts.password, std::ref(progress));
        }
        handle = transfer::OpenFileHandle(spool);
        transfer::TransferSession session = manager.InitiateUpload(
            handle, {{"clientEncrypted", "true"}, {"encryptionAlgorithm", "AES-256-GCM"}});
        file_id = session.file_id;
        std::cout << "Uploading " << HumanSize(session.file_size) << " in " << session.total_chunks << " chunk(s)\n";
    }

    std::signal(SIGINT, HandleInterrupt);
    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished.load()) {
            if (g_interrupted.exchange(false)) {
                std::cerr << "\nPausing after in-flight chunks finish...\n";
                manager.Pause(*file_id);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    struct WatcherJoin {
        std::atomic<bool>& finished;
        std::thread& thread;
        ~WatcherJoin() {
            finished.store(true);
            if (thread.joinable()) {
                thread.join();
            }
            std::signal(SIGINT, SIG_DFL);
        }
    } join{finished, watcher};

    std::optional<transfer::CompletionResult> result = manager.UploadFile(
        *file_id, opts.options, [](const transfer::UploadProgress& p) {
            std::cerr << "\rUploading: " << p.completed_chunks << "/" << p.total_chunks << " chunks ("
                      << std::fixed << std::setprecision(1) << p.progress << "%, " << HumanSize(p.uploaded_bytes)
                      << ")" << std::flush;
        });
    std::cerr << "\n";

    if (!result) {
        std::cout << sealdrop::cli::Yellow("Upload paused. ") << "Run the same command again to resume.\n";
        if (generated) {
            PrintGeneratedPassword(opts.password);
        }
        return kExitPaused;
    }
    fs::remove(spool, ec);
    std::cout << sealdrop::cli::BoldGreen("Upload complete") << "\n";
    std::cout << "Retrieval code: " << result->retrieval_code << "\n";
    std::cout << "Retrieval URL: " << result->retrieval_url << "\n";
    if (generated) {
        PrintGeneratedPassword(opts.password);
    }
    return kExitOk;
}

int RunSessions(int argc, char** argv) {
    StateArgs opts = ParseStateArgs(argc, argv, 2, false);
    transfer::ClientSettings settings = ResolveSettings(opts.state);
    transfer::YamlSessionStore store(settings.state_file);
    transfer::SessionTable table = store.Load();
    if (table.empty()) {
        std::cout << "No upload sessions\n";
        return kExitOk;
    }
    const auto now = transfer::Clock::now();
    for (const auto& [file_id, session] : table) {
        std::cout << file_id << "\n";
        std::cout << "  status: " << transfer::ToString(session.status)
                  << (session.IsExpired(now) ? sealdrop::cli::Dim(" (expired)") : std::string()) << "\n";
        std::cout << "  chunks: " << session.completed_chunks.size() << "/" << session.total_chunks << " ("
                  << std::fixed << std::setprecision(1) << session.progress << "%)\n";
        std::cout << "  size: " << HumanSize(session.file_size) << "\n";
        std::cout << "  expires: " << transfer::FormatTimestamp(session.expires_at) << "\n";
        if (!session.last_error.empty()) {
            std::cout << "  last error: " << session.last_error << "\n";
        }
    }
    return kExitOk;
}

int RunCancel(int argc, char** argv) {
    StateArgs opts = ParseStateArgs(argc, argv, 2, true);
    if (opts.target.empty()) {
        throw UsageError("Missing --target directory");
    }
    transfer::ClientSettings settings = ResolveSettings(opts.state);
    transfer::YamlSessionStore store(settings.state_file);
    transfer::LocalUploadService service(opts.target);
    transfer::TransferManager manager(service, service, store, settings.ToTransferConfig());

    std::optional<transfer::TransferSession> session = manager.GetSession(opts.subject);
    if (!session) {
        throw std::runtime_error("No upload session for " + opts.subject);
    }
    manager.Cancel(opts.subject);
    std::error_code ec;
    fs::remove(SpoolDir(settings) / session->file_name, ec);
    std::cout << "Cancelled " << opts.subject << "\n";
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    std::string command(argv[1]);
    try {
        if (command == "encrypt") {
            return RunEncrypt(argc, argv);
        }
        if (command == "decrypt") {
            return RunDecrypt(argc, argv);
        }
        if (command == "info") {
            return RunInfo(argc, argv);
        }
        if (command == "strength") {
            return RunStrength(argc, argv);
        }
        if (command == "genpass") {
            return RunGenpass(argc, argv);
        }
        if (command == "upload") {
            return RunUpload(argc, argv);
        }
        if (command == "sessions") {
            return RunSessions(argc, argv);
        }
        if (command == "cancel") {
            return RunCancel(argc, argv);
        }
        PrintUsage();
        return kExitUsage;
    } catch (const UsageError& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        PrintUsage();
        return kExitUsage;
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return kExitError;
    }
}
