#pragma once

#include "file_entry.hpp"
#include "result.hpp"
#include "transfer_manager.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace webxfer {

template <typename T>
using Callback = std::function<void(Result<T>)>;

struct OperationContext {
    std::string connection_id;
    std::string session_id;
};

struct DirectoryListing {
    std::string path;
    std::vector<FileEntry> entries;
};

struct StatResult {
    std::string path;
    FileEntry entry;
};

struct OperationResult {
    bool success = true;
    std::string path;
};

struct UploadStartRequest {
    std::string transfer_id;
    std::string session_id;
    std::string connection_id;
    std::string remote_path;
    std::string file_name;
    std::uint64_t file_size = 0;
    bool overwrite = false;
};

struct UploadReady {
    std::string transfer_id;
    size_t chunk_size = 0;
    size_t max_concurrent_chunks = 1;
};

struct UploadChunkRequest {
    std::string transfer_id;
    std::uint64_t chunk_index = 0;
    std::string data; // decoded bytes
    bool is_last = false;
};

struct UploadAck {
    std::string transfer_id;
    std::uint64_t chunk_index = 0;
    std::uint64_t bytes_received = 0;
};

struct DownloadStartRequest {
    std::string transfer_id;
    std::string session_id;
    std::string connection_id;
    std::string remote_path;
};

struct DownloadReady {
    std::string transfer_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string mime_type;
};

struct DownloadChunk {
    std::string transfer_id;
    std::uint64_t chunk_index = 0;
    std::string data; // raw bytes
    bool is_last = false;
};

struct DownloadCallbacks {
    std::function<void(const DownloadChunk &)> on_chunk;
    std::function<void(const TransferProgress &)> on_progress;
    std::function<void(const TransferCompletion &)> on_complete;
    std::function<void(const Error &)> on_error;
};

// Remote filesystem access for one kind of remote host.
// Callbacks fire exactly once, possibly before the call returns.
class FileBackend {
public:
    virtual ~FileBackend() = default;

    virtual const char *name() const = 0;
    virtual bool isEnabled() const = 0;

    virtual void listDirectory(const OperationContext &ctx, const std::string &path, const bool &show_hidden, Callback<DirectoryListing> done) = 0;
    virtual void stat(const OperationContext &ctx, const std::string &path, Callback<StatResult> done) = 0;
    virtual void mkdir(const OperationContext &ctx, const std::string &path, const std::optional<std::uint32_t> &mode, Callback<OperationResult> done) = 0;
    virtual void deletePath(const OperationContext &ctx, const std::string &path, const bool &recursive, Callback<OperationResult> done) = 0;

    virtual void startUpload(const UploadStartRequest &request, Callback<UploadReady> done) = 0;
    virtual void processUploadChunk(UploadChunkRequest request, Callback<UploadAck> done) = 0;
    virtual void completeUpload(const std::string &transfer_id, Callback<TransferCompletion> done) = 0;
    virtual void cancelUpload(const std::string &transfer_id) = 0;

    virtual void startDownload(const DownloadStartRequest &request, Callback<DownloadReady> done) = 0;
    virtual void streamDownloadChunks(const std::string &transfer_id, DownloadCallbacks callbacks) = 0;
    virtual void cancelDownload(const std::string &transfer_id) = 0;

    virtual void closeSession(const std::string &connection_id) = 0;
    virtual void cancelSessionTransfers(const std::string &session_id) = 0;
};

}
