#include "chunkfs/Error.hpp"

#include <array>
#include <utility>

namespace chunkfs {

namespace {

constexpr std::array<std::pair<ErrorCode, std::string_view>, 12> kErrorNames{{
    {ErrorCode::NotFound, "NOT_FOUND"},
    {ErrorCode::DuplicateFile, "DUPLICATE_FILE"},
    {ErrorCode::NoActiveNodes, "NO_ACTIVE_NODES"},
    {ErrorCode::ChunkTransferFailed, "CHUNK_TRANSFER_FAILED"},
    {ErrorCode::ChunkNotFound, "CHUNK_NOT_FOUND"},
    {ErrorCode::NodeUnreachable, "NODE_UNREACHABLE"},
    {ErrorCode::CoordinatorUnreachable, "COORDINATOR_UNREACHABLE"},
    {ErrorCode::InvalidArgument, "INVALID_ARGUMENT"},
    {ErrorCode::StorageFailure, "STORAGE_FAILURE"},
    {ErrorCode::ProtocolError, "PROTOCOL_ERROR"},
    {ErrorCode::UploadIncomplete, "UPLOAD_INCOMPLETE"},
    {ErrorCode::DownloadIncomplete, "DOWNLOAD_INCOMPLETE"},
}};

}  // namespace

std::string_view error_code_to_string(ErrorCode code) {
    for (const auto& [value, name] : kErrorNames) {
        if (value == code) {
            return name;
        }
    }
    return "PROTOCOL_ERROR";
}

std::optional<ErrorCode> error_code_from_string(std::string_view text) {
    for (const auto& [value, name] : kErrorNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

Error::Error(ErrorCode code, std::string message, std::string hint)
    : code_(code), message_(std::move(message)), hint_(std::move(hint)) {
    formatted_ = "[" + std::string(error_code_to_string(code_)) + "] " + message_;
}

[[noreturn]] void throw_error(ErrorCode code, std::string message, std::string hint) {
    throw Error(code, std::move(message), std::move(hint));
}

}  // namespace chunkfs
