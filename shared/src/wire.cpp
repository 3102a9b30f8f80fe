#include "webxfer/wire.hpp"
#include "webxfer/backend_common.hpp"
#include "webxfer/helpers.hpp"

#include <limits>

namespace webxfer {

using nlohmann::json;

void to_json(json &j, const FileEntry &entry) {
    j = json{
        {"name", entry.name},
        {"path", entry.path},
        {"type", entry_type_name(entry.type)},
        {"size", entry.size},
        {"permissions", entry.permissions},
        {"permissionsOctal", entry.permissions_octal},
        {"owner", entry.owner},
        {"group", entry.group},
        {"modifiedAt", entry.modified_at},
        {"accessedAt", entry.accessed_at},
        {"isHidden", entry.is_hidden},
    };
}

void to_json(json &j, const DirectoryListing &listing) {
    j = json{{"path", listing.path}, {"entries", listing.entries}};
}

void to_json(json &j, const StatResult &result) {
    j = json{{"path", result.path}, {"entry", result.entry}};
}

void to_json(json &j, const OperationResult &result) {
    j = json{{"success", result.success}, {"path", result.path}};
}

void to_json(json &j, const UploadReady &ready) {
    j = json{
        {"transferId", ready.transfer_id},
        {"chunkSize", ready.chunk_size},
        {"maxConcurrentChunks", ready.max_concurrent_chunks},
    };
}

void to_json(json &j, const UploadAck &ack) {
    j = json{
        {"transferId", ack.transfer_id},
        {"chunkIndex", ack.chunk_index},
        {"bytesReceived", ack.bytes_received},
    };
}

void to_json(json &j, const DownloadReady &ready) {
    j = json{
        {"transferId", ready.transfer_id},
        {"fileName", ready.file_name},
        {"fileSize", ready.file_size},
        {"mimeType", ready.mime_type},
    };
}

void to_json(json &j, const DownloadChunk &chunk) {
    j = json{
        {"transferId", chunk.transfer_id},
        {"chunkIndex", chunk.chunk_index},
        {"data", base64_encode(chunk.data)},
        {"isLast", chunk.is_last},
    };
}

void to_json(json &j, const TransferProgress &progress) {
    j = json{
        {"transferId", progress.transfer_id},
        {"direction", direction_name(progress.direction)},
        {"bytesTransferred", progress.bytes_transferred},
        {"totalBytes", progress.total_bytes},
        {"percentComplete", progress.percent_complete},
        {"bytesPerSecond", progress.bytes_per_second},
        {"estimatedSecondsRemaining", progress.estimated_seconds_remaining},
    };
}

void to_json(json &j, const TransferCompletion &completion) {
    j = json{
        {"transferId", completion.transfer_id},
        {"direction", direction_name(completion.direction)},
        {"bytesTransferred", completion.bytes_transferred},
        {"durationMs", completion.duration_ms},
        {"averageBytesPerSecond", completion.average_bytes_per_second},
    };
}

json error_payload(const std::string &operation, const Error &error) {
    json j{
        {"operation", operation},
        {"code", error_code_name(error.code)},
        {"message", error.message},
    };
    if (!error.path.empty()) {
        j["path"] = error.path;
    }
    if (!error.transfer_id.empty()) {
        j["transferId"] = error.transfer_id;
    }
    if (!error.reason.empty()) {
        j["reason"] = error.reason;
    }
    return j;
}

std::string make_event(const std::string &name, const json &data) {
    // remote file names are not guaranteed to be valid UTF-8
    return json{{"event", name}, {"data", data}}.dump(-1, ' ', false, json::error_handler_t::replace);
}

// request parsing

namespace {

Error invalid(const std::string &message) {
    return make_error(ErrorCode::InvalidRequest, message);
}

Result<std::string> string_field(const json &data, const char *key) {
    if (!data.is_object() || !data.contains(key) || !data.at(key).is_string()) {
        return invalid(std::string(key) + " must be a string");
    }
    return data.at(key).get<std::string>();
}

Result<std::string> optional_string_field(const json &data, const char *key) {
    if (!data.is_object() || !data.contains(key) || data.at(key).is_null()) {
        return std::string();
    }
    return string_field(data, key);
}

Result<bool> bool_field(const json &data, const char *key, const bool &fallback) {
    if (!data.is_object() || !data.contains(key) || data.at(key).is_null()) {
        return fallback;
    }
    if (!data.at(key).is_boolean()) {
        return invalid(std::string(key) + " must be a boolean");
    }
    return data.at(key).get<bool>();
}

Result<std::uint64_t> uint_field(const json &data, const char *key, const std::uint64_t &max) {
    if (!data.is_object() || !data.contains(key)) {
        return invalid(std::string(key) + " is required");
    }
    const json &value = data.at(key);
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<std::int64_t>() < 0)) {
        return invalid(std::string(key) + " must be a non-negative integer");
    }
    const std::uint64_t number = value.get<std::uint64_t>();
    if (number > max) {
        return invalid(std::string(key) + " must be between 0 and " + std::to_string(max));
    }
    return number;
}

}

Result<ListMessage> parse_list_message(const json &data) {
    auto path = string_field(data, "path");
    if (path.is_err()) {
        return path.error();
    }
    auto hidden = bool_field(data, "showHidden", false);
    if (hidden.is_err()) {
        return hidden.error();
    }
    return ListMessage{path.unwrap(), hidden.unwrap()};
}

Result<std::string> parse_stat_message(const json &data) {
    return string_field(data, "path");
}

Result<MkdirMessage> parse_mkdir_message(const json &data) {
    auto path = string_field(data, "path");
    if (path.is_err()) {
        return path.error();
    }
    MkdirMessage message{path.unwrap(), std::nullopt};
    if (data.contains("mode") && !data.at("mode").is_null()) {
        auto mode = uint_field(data, "mode", 0777);
        if (mode.is_err()) {
            return mode.error();
        }
        message.mode = static_cast<std::uint32_t>(mode.unwrap());
    }
    return message;
}

Result<DeleteMessage> parse_delete_message(const json &data) {
    auto path = string_field(data, "path");
    if (path.is_err()) {
        return path.error();
    }
    auto recursive = bool_field(data, "recursive", false);
    if (recursive.is_err()) {
        return recursive.error();
    }
    return DeleteMessage{path.unwrap(), recursive.unwrap()};
}

Result<UploadStartMessage> parse_upload_start_message(const json &data) {
    auto id = optional_string_field(data, "transferId");
    if (id.is_err()) {
        return id.error();
    }
    auto remote_path = string_field(data, "remotePath");
    if (remote_path.is_err()) {
        return remote_path.error();
    }
    auto file_name = string_field(data, "fileName");
    if (file_name.is_err()) {
        return file_name.error();
    }
    auto file_size = uint_field(data, "fileSize", std::numeric_limits<std::int64_t>::max());
    if (file_size.is_err()) {
        return file_size.error();
    }
    auto overwrite = bool_field(data, "overwrite", false);
    if (overwrite.is_err()) {
        return overwrite.error();
    }

    UploadStartMessage message;
    message.transfer_id = id.unwrap();
    message.remote_path = remote_path.unwrap();
    message.file_name = file_name.unwrap();
    message.file_size = file_size.unwrap();
    message.overwrite = overwrite.unwrap();
    return message;
}

Result<UploadChunkRequest> parse_upload_chunk_message(const json &data, const size_t &chunk_size) {
    auto id = string_field(data, "transferId");
    if (id.is_err()) {
        return id.error();
    }
    auto index = uint_field(data, "chunkIndex", MAX_CHUNK_INDEX);
    if (index.is_err()) {
        return with_transfer(index.error(), id.unwrap());
    }
    auto is_last = bool_field(data, "isLast", false);
    if (is_last.is_err()) {
        return with_transfer(is_last.error(), id.unwrap());
    }
    auto encoded = string_field(data, "data");
    if (encoded.is_err()) {
        return with_transfer(encoded.error(), id.unwrap());
    }

    const size_t max_encoded = (chunk_size + 2) / 3 * 4;
    if (encoded.unwrap().size() > max_encoded) {
        return make_error(ErrorCode::ChunkError, "Chunk exceeds " + std::to_string(chunk_size) + " bytes", "", id.unwrap());
    }
    auto decoded = base64_decode(encoded.unwrap());
    if (!decoded) {
        return make_error(ErrorCode::ChunkError, "Chunk data is not valid base64", "", id.unwrap());
    }
    if (decoded->size() > chunk_size) {
        return make_error(ErrorCode::ChunkError, "Chunk exceeds " + std::to_string(chunk_size) + " bytes", "", id.unwrap());
    }
    return UploadChunkRequest{id.unwrap(), index.unwrap(), std::move(*decoded), is_last.unwrap()};
}

Result<std::string> parse_cancel_message(const json &data) {
    return string_field(data, "transferId");
}

Result<DownloadStartMessage> parse_download_start_message(const json &data) {
    auto id = optional_string_field(data, "transferId");
    if (id.is_err()) {
        return id.error();
    }
    auto remote_path = string_field(data, "remotePath");
    if (remote_path.is_err()) {
        return remote_path.error();
    }
    return DownloadStartMessage{id.unwrap(), remote_path.unwrap()};
}

}
