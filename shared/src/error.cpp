#include "webxfer/error.hpp"

namespace webxfer {

const char *error_code_name(const ErrorCode &code) {
    switch (code) {
        case ErrorCode::NotEnabled:        return "SFTP_NOT_ENABLED";
        case ErrorCode::InvalidRequest:    return "SFTP_INVALID_REQUEST";
        case ErrorCode::NotFound:          return "SFTP_NOT_FOUND";
        case ErrorCode::PermissionDenied:  return "SFTP_PERMISSION_DENIED";
        case ErrorCode::Timeout:           return "SFTP_TIMEOUT";
        case ErrorCode::SessionError:      return "SFTP_SESSION_ERROR";
        case ErrorCode::PathForbidden:     return "SFTP_PATH_FORBIDDEN";
        case ErrorCode::ExtensionBlocked:  return "SFTP_EXTENSION_BLOCKED";
        case ErrorCode::AlreadyExists:     return "SFTP_ALREADY_EXISTS";
        case ErrorCode::FileTooLarge:      return "SFTP_FILE_TOO_LARGE";
        case ErrorCode::ChunkError:        return "SFTP_CHUNK_ERROR";
        case ErrorCode::MaxTransfers:      return "SFTP_MAX_TRANSFERS";
        case ErrorCode::NoConnection:      return "SFTP_NO_CONNECTION";
        case ErrorCode::TransferCancelled: return "SFTP_TRANSFER_CANCELLED";
        case ErrorCode::RateLimited:       return "SFTP_RATE_LIMITED";
    }
    return "SFTP_SESSION_ERROR";
}

Error make_error(const ErrorCode &code, const std::string &message, const std::string &path, const std::string &transfer_id) {
    Error err;
    err.code = code;
    err.message = message;
    err.path = path;
    err.transfer_id = transfer_id;
    return err;
}

}
