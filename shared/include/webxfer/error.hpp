#pragma once

#include <string>

namespace webxfer {

enum class ErrorCode {
    NotEnabled,
    InvalidRequest,
    NotFound,
    PermissionDenied,
    Timeout,
    SessionError,
    PathForbidden,
    ExtensionBlocked,
    AlreadyExists,
    FileTooLarge,
    ChunkError,
    MaxTransfers,
    NoConnection,
    TransferCancelled,
    RateLimited
};

// Wire name of an error code, e.g. "SFTP_NOT_FOUND".
const char *error_code_name(const ErrorCode &code);

struct Error {
    ErrorCode code = ErrorCode::SessionError;
    std::string message;
    std::string path;
    std::string transfer_id;
    // path-validator detail such as "PATH_TRAVERSAL", empty otherwise
    std::string reason;
};

Error make_error(const ErrorCode &code, const std::string &message, const std::string &path = "", const std::string &transfer_id = "");

}
