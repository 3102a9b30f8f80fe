#pragma once

#include "file_backend.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace webxfer {

namespace events {
// client -> server
constexpr const char *LIST = "sftp-list";
constexpr const char *STAT = "sftp-stat";
constexpr const char *MKDIR = "sftp-mkdir";
constexpr const char *DELETE = "sftp-delete";
constexpr const char *UPLOAD_START = "sftp-upload-start";
constexpr const char *UPLOAD_CHUNK = "sftp-upload-chunk";
constexpr const char *UPLOAD_CANCEL = "sftp-upload-cancel";
constexpr const char *DOWNLOAD_START = "sftp-download-start";
constexpr const char *DOWNLOAD_CANCEL = "sftp-download-cancel";
// server -> client
constexpr const char *DIRECTORY = "sftp-directory";
constexpr const char *STAT_RESULT = "sftp-stat-result";
constexpr const char *OPERATION_RESULT = "sftp-operation-result";
constexpr const char *UPLOAD_READY = "sftp-upload-ready";
constexpr const char *UPLOAD_ACK = "sftp-upload-ack";
constexpr const char *DOWNLOAD_READY = "sftp-download-ready";
constexpr const char *DOWNLOAD_CHUNK = "sftp-download-chunk";
constexpr const char *PROGRESS = "sftp-progress";
constexpr const char *COMPLETE = "sftp-complete";
constexpr const char *ERROR = "sftp-error";
}

constexpr std::uint64_t MAX_CHUNK_INDEX = 1000000;

void to_json(nlohmann::json &j, const FileEntry &entry);
void to_json(nlohmann::json &j, const DirectoryListing &listing);
void to_json(nlohmann::json &j, const StatResult &result);
void to_json(nlohmann::json &j, const OperationResult &result);
void to_json(nlohmann::json &j, const UploadReady &ready);
void to_json(nlohmann::json &j, const UploadAck &ack);
void to_json(nlohmann::json &j, const DownloadReady &ready);
void to_json(nlohmann::json &j, const DownloadChunk &chunk); // data goes out base64 encoded
void to_json(nlohmann::json &j, const TransferProgress &progress);
void to_json(nlohmann::json &j, const TransferCompletion &completion);

nlohmann::json error_payload(const std::string &operation, const Error &error);
// {"event": name, "data": data} serialized for send_msg
std::string make_event(const std::string &name, const nlohmann::json &data);

struct ListMessage {
    std::string path;
    bool show_hidden = false;
};

struct MkdirMessage {
    std::string path;
    std::optional<std::uint32_t> mode;
};

struct DeleteMessage {
    std::string path;
    bool recursive = false;
};

struct UploadStartMessage {
    std::string transfer_id; // empty when the client left it to the server
    std::string remote_path;
    std::string file_name;
    std::uint64_t file_size = 0;
    bool overwrite = false;
};

struct DownloadStartMessage {
    std::string transfer_id;
    std::string remote_path;
};

Result<ListMessage> parse_list_message(const nlohmann::json &data);
Result<std::string> parse_stat_message(const nlohmann::json &data);
Result<MkdirMessage> parse_mkdir_message(const nlohmann::json &data);
Result<DeleteMessage> parse_delete_message(const nlohmann::json &data);
Result<UploadStartMessage> parse_upload_start_message(const nlohmann::json &data);
// Decodes the base64 payload, which may not exceed what `chunk_size` bytes encode to.
Result<UploadChunkRequest> parse_upload_chunk_message(const nlohmann::json &data, const size_t &chunk_size);
Result<std::string> parse_cancel_message(const nlohmann::json &data);
Result<DownloadStartMessage> parse_download_start_message(const nlohmann::json &data);

}
