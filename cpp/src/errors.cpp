#include "sealdrop/errors.hpp"

#include <utility>

namespace sealdrop {

InvalidPassword::InvalidPassword() : Error("Invalid password") {}

TransferError::TransferError(std::string file_id,
                             std::optional<std::uint32_t> chunk_index,
                             const std::string& message)
    : Error(message), file_id_(std::move(file_id)), chunk_index_(chunk_index) {}

ChunkUploadFailed::ChunkUploadFailed(std::string file_id,
                                     std::uint32_t chunk_index,
                                     std::uint32_t attempts,
                                     const std::string& cause)
    : TransferError(std::move(file_id), chunk_index,
                    "Chunk " + std::to_string(chunk_index) + " failed after " + std::to_string(attempts)
                        + " attempt(s): " + cause),
      attempts_(attempts),
      cause_(cause) {}

SessionExpired::SessionExpired(std::string file_id)
    : TransferError(std::move(file_id), std::nullopt, "Upload session expired or unknown") {}

SessionCancelled::SessionCancelled(std::string file_id)
    : TransferError(std::move(file_id), std::nullopt, "Upload cancelled") {}

ApiError::ApiError(int status, const std::string& message) : Error(message), status_(status) {}

}  // namespace sealdrop
