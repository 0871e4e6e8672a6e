#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace sealdrop {

// Base of every error the library throws on purpose. Anything else that
// escapes a collaborator (transport, filesystem) is a plain std::exception.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    // Whether repeating the same call can succeed.
    virtual bool Retryable() const noexcept { return false; }
};

class CryptoUnsupported : public Error {
public:
    using Error::Error;
};

// Raised for any failure while opening the metadata section. The message is
// fixed and never says whether the password or the data was at fault.
class InvalidPassword : public Error {
public:
    InvalidPassword();
};

class MalformedEnvelope : public Error {
public:
    using Error::Error;
};

class CorruptedPayload : public Error {
public:
    using Error::Error;
};

class TransferError : public Error {
public:
    TransferError(std::string file_id, std::optional<std::uint32_t> chunk_index, const std::string& message);

    const std::string& file_id() const noexcept { return file_id_; }
    const std::optional<std::uint32_t>& chunk_index() const noexcept { return chunk_index_; }

private:
    std::string file_id_;
    std::optional<std::uint32_t> chunk_index_;
};

class ChunkUploadFailed : public TransferError {
public:
    ChunkUploadFailed(std::string file_id, std::uint32_t chunk_index, std::uint32_t attempts, const std::string& cause);

    std::uint32_t attempts() const noexcept { return attempts_; }
    const std::string& cause() const noexcept { return cause_; }
    bool Retryable() const noexcept override { return true; }

private:
    std::uint32_t attempts_;
    std::string cause_;
};

class SessionExpired : public TransferError {
public:
    explicit SessionExpired(std::string file_id);
};

class SessionCancelled : public TransferError {
public:
    explicit SessionCancelled(std::string file_id);
};

// Failure reported by an upload API or chunk transport implementation.
class ApiError : public Error {
public:
    ApiError(int status, const std::string& message);

    int status() const noexcept { return status_; }
    bool Retryable() const noexcept override { return status_ == 0 || status_ >= 500 || status_ == 429; }

private:
    int status_;
};

}  // namespace sealdrop
