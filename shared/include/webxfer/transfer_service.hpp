#pragma once

#include "native_backend.hpp"
#include "shell_backend.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace webxfer {

// Entry point for the transport layer. Local checks run before any connection
// lookup; chunk and cancel requests are honored only for the owning session.
class TransferService {
public:
    TransferService(SftpConfig config, ConnectionLookup lookup, Scheduler &scheduler);
    ~TransferService();

    TransferService(const TransferService &) = delete;
    TransferService &operator=(const TransferService &) = delete;

    bool isEnabled() const;
    const SftpConfig &config() const;

    void listDirectory(const OperationContext &ctx, const std::string &path, const bool &show_hidden, Callback<DirectoryListing> done);
    void stat(const OperationContext &ctx, const std::string &path, Callback<StatResult> done);
    void mkdir(const OperationContext &ctx, const std::string &path, const std::optional<std::uint32_t> &mode, Callback<OperationResult> done);
    void deletePath(const OperationContext &ctx, const std::string &path, const bool &recursive, Callback<OperationResult> done);

    // An invalid or empty request.transfer_id is replaced by a server-issued one.
    void startUpload(UploadStartRequest request, Callback<UploadReady> done);
    // `completed` fires after the ack of the last chunk.
    void processUploadChunk(const std::string &session_id, UploadChunkRequest request, Callback<UploadAck> acked, Callback<TransferCompletion> completed);
    void completeUpload(const std::string &session_id, const std::string &transfer_id, Callback<TransferCompletion> done);
    void cancelUpload(const std::string &session_id, const std::string &transfer_id);

    // Streaming starts right after `ready` succeeds.
    void startDownload(DownloadStartRequest request, Callback<DownloadReady> ready, DownloadCallbacks stream);
    void cancelDownload(const std::string &session_id, const std::string &transfer_id);

    Result<Ok> pauseTransfer(const std::string &session_id, const std::string &transfer_id);
    Result<Ok> resumeTransfer(const std::string &session_id, const std::string &transfer_id);
    Result<TransferProgress> getProgress(const std::string &session_id, const std::string &transfer_id) const;

    void disconnect(const std::string &connection_id, const std::string &session_id);
    void shutdown();

    size_t activeTransfers() const;
    std::string resolveTransferId(const std::string &requested) const;

private:
    const SftpConfig cfg;
    Scheduler &scheduler;
    TransferManager transfers;
    SessionStore native_sessions;
    SessionStore shell_sessions;
    NativeBackend native;
    ShellBackend shell;
    std::unordered_map<std::string, FileBackend *> bindings;
    // auto-mode probes in flight per connection
    std::unordered_map<std::string, size_t> probing;

    void withBackend(const OperationContext &ctx, Callback<FileBackend *> done);
    FileBackend *backendOf(const std::string &connection_id);
    Result<Transfer> owned(const std::string &session_id, const std::string &transfer_id, const char *operation) const;
};

}
