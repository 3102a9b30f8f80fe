#include "webxfer/backend_common.hpp"

#include <algorithm>
#include <cctype>

namespace webxfer {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool contains(const std::string &haystack, const char *needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string trim(const std::string &text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    return text.substr(start, text.find_last_not_of(" \t\r\n") - start + 1);
}

}

Error map_remote_error(const RemoteError &error, const std::string &path) {
    switch (error.status) {
        case REMOTE_TIMEOUT_STATUS:
            return make_error(ErrorCode::Timeout, error.message.empty() ? "Operation timed out" : error.message, path);
        case SSH_FX_NO_SUCH_FILE:
            return make_error(ErrorCode::NotFound, error.message.empty() ? "No such file or directory" : error.message, path);
        case SSH_FX_PERMISSION_DENIED:
            return make_error(ErrorCode::PermissionDenied, error.message.empty() ? "Permission denied" : error.message, path);
        case SSH_FX_FILE_ALREADY_EXISTS:
            return make_error(ErrorCode::AlreadyExists, error.message.empty() ? "File already exists" : error.message, path);
        default:
            break;
    }

    const std::string text = lower(error.message);
    if (contains(text, "no such file") || contains(text, "not found")) {
        return make_error(ErrorCode::NotFound, error.message, path);
    }
    if (contains(text, "permission denied") || contains(text, "access denied")) {
        return make_error(ErrorCode::PermissionDenied, error.message, path);
    }
    if (contains(text, "timed out") || contains(text, "timeout")) {
        return make_error(ErrorCode::Timeout, error.message, path);
    }
    return make_error(ErrorCode::SessionError, error.message.empty() ? "Remote operation failed" : error.message, path);
}

Error map_command_error(const std::string &stderr_text, const int &exit_code, const std::string &path) {
    const std::string message = trim(stderr_text);
    const std::string text = lower(message);
    if (contains(text, "no such file") || contains(text, "not found") || contains(text, "cannot access")) {
        return make_error(ErrorCode::NotFound, message, path);
    }
    if (contains(text, "permission denied") || contains(text, "operation not permitted")) {
        return make_error(ErrorCode::PermissionDenied, message, path);
    }
    if (contains(text, "file exists") || contains(text, "cannot overwrite existing file")) {
        return make_error(ErrorCode::AlreadyExists, message, path);
    }
    if (message.empty()) {
        return make_error(ErrorCode::SessionError, "Command failed (exit code " + std::to_string(exit_code) + ")", path);
    }
    return make_error(ErrorCode::SessionError, message, path);
}

Error map_path_error(const PathError &error, const std::string &path) {
    ErrorCode code = ErrorCode::InvalidRequest;
    if (error.code == PathErrorCode::PathForbidden) {
        code = ErrorCode::PathForbidden;
    } else if (error.code == PathErrorCode::ExtensionBlocked) {
        code = ErrorCode::ExtensionBlocked;
    }
    Error err = make_error(code, error.message, path);
    err.reason = path_error_name(error.code);
    return err;
}

Error map_transfer_error(const TransferError &error) {
    switch (error.code) {
        case TransferErrorCode::MaxTransfers:
            return make_error(ErrorCode::MaxTransfers, error.message, "", error.transfer_id);
        case TransferErrorCode::ChunkMismatch:
            return make_error(ErrorCode::ChunkError, error.message, "", error.transfer_id);
        case TransferErrorCode::NotFound:
        case TransferErrorCode::NotOwner:
            // identical answer for unknown and foreign ids
            return make_error(ErrorCode::InvalidRequest, "Transfer not found", "", error.transfer_id);
        case TransferErrorCode::InvalidState:
            return make_error(ErrorCode::InvalidRequest, error.message, "", error.transfer_id);
    }
    return make_error(ErrorCode::InvalidRequest, error.message, "", error.transfer_id);
}

PathValidationOptions validation_options(const SftpConfig &config, const bool &check_extension) {
    PathValidationOptions options;
    options.allowed_paths = config.allowed_paths;
    options.blocked_extensions = config.blocked_extensions;
    options.check_extension = check_extension;
    return options;
}

Result<std::string> check_request_path(const SftpConfig &config, const std::string &path, const bool &check_extension) {
    if (!config.enabled) {
        return make_error(ErrorCode::NotEnabled, "File transfer is not enabled");
    }
    PathResult validated = validate_path(path, validation_options(config, check_extension));
    if (validated.is_err()) {
        return map_path_error(validated.error(), path);
    }
    return validated.unwrap();
}

std::string substitute_home(const std::string &path, const std::string &home) {
    if (path == "~") {
        return home;
    }
    if (path.starts_with("~/")) {
        if (home == "/") {
            return path.substr(1);
        }
        return home + path.substr(1);
    }
    return path;
}

Error with_transfer(Error error, const std::string &transfer_id) {
    error.transfer_id = transfer_id;
    return error;
}

std::optional<Error> check_chunk_bounds(const Transfer &transfer, const std::uint64_t &chunk_bytes, const bool &is_last) {
    const std::uint64_t end = transfer.bytes_transferred + chunk_bytes;
    if (end > transfer.total_bytes) {
        return make_error(ErrorCode::ChunkError,
            "Chunk exceeds declared file size (" + std::to_string(end) + " of " + std::to_string(transfer.total_bytes) + " bytes)",
            transfer.remote_path, transfer.id);
    }
    if (is_last && end != transfer.total_bytes) {
        return make_error(ErrorCode::ChunkError,
            "Last chunk ends at " + std::to_string(end) + " of " + std::to_string(transfer.total_bytes) + " bytes",
            transfer.remote_path, transfer.id);
    }
    return std::nullopt;
}

}
