#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace chunkfs {

enum class ErrorCode {
    NotFound,
    DuplicateFile,
    NoActiveNodes,
    ChunkTransferFailed,
    ChunkNotFound,
    NodeUnreachable,
    CoordinatorUnreachable,
    InvalidArgument,
    StorageFailure,
    ProtocolError,
    UploadIncomplete,
    DownloadIncomplete
};

// Stable wire spelling, e.g. "DUPLICATE_FILE".
std::string_view error_code_to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(std::string_view text);

class Error : public std::exception {
public:
    Error(ErrorCode code, std::string message, std::string hint = {});

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_error(ErrorCode code, std::string message, std::string hint = {});

}  // namespace chunkfs
