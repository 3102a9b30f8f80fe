#pragma once

#include "backend_common.hpp"
#include "file_backend.hpp"
#include "session_store.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace webxfer {

// Backend for hosts without an SFTP subsystem: every operation runs a shell command.
class ShellBackend : public FileBackend {
public:
    struct CommandOutput {
        std::string out;
        std::string err;
        int exit_code = 0;
    };

    ShellBackend(const SftpConfig &config, TransferManager &transfers, SessionStore &sessions,
                 ConnectionLookup lookup, Scheduler &scheduler);
    ~ShellBackend() override;

    const char *name() const override;
    bool isEnabled() const override;

    void listDirectory(const OperationContext &ctx, const std::string &path, const bool &show_hidden, Callback<DirectoryListing> done) override;
    void stat(const OperationContext &ctx, const std::string &path, Callback<StatResult> done) override;
    void mkdir(const OperationContext &ctx, const std::string &path, const std::optional<std::uint32_t> &mode, Callback<OperationResult> done) override;
    void deletePath(const OperationContext &ctx, const std::string &path, const bool &recursive, Callback<OperationResult> done) override;

    void startUpload(const UploadStartRequest &request, Callback<UploadReady> done) override;
    void processUploadChunk(UploadChunkRequest request, Callback<UploadAck> done) override;
    void completeUpload(const std::string &transfer_id, Callback<TransferCompletion> done) override;
    void cancelUpload(const std::string &transfer_id) override;

    void startDownload(const DownloadStartRequest &request, Callback<DownloadReady> done) override;
    void streamDownloadChunks(const std::string &transfer_id, DownloadCallbacks callbacks) override;
    void cancelDownload(const std::string &transfer_id) override;

    void closeSession(const std::string &connection_id) override;
    void cancelSessionTransfers(const std::string &session_id) override;

    size_t activeDownloads() const;

private:
    struct Setup {
        std::string path;
        std::shared_ptr<BackendSession> session;
    };

    struct UploadPipe {
        std::string session_id;
        std::string connection_id;
        std::string path;
        std::shared_ptr<ExecChannel> channel;
        std::string stderr_text;
        std::optional<RemoteError> error;
        int exit_code = 0;
        bool closed = false;
        bool ended = false;
        bool busy = false;
        size_t stalls = 0;
        std::function<void()> on_closed;
    };

    class DownloadPipe;

    const SftpConfig &config;
    TransferManager &transfers;
    SessionStore &sessions;
    ConnectionLookup lookup;
    Scheduler &scheduler;

    std::unordered_map<std::string, std::shared_ptr<UploadPipe>> uploads;
    std::unordered_map<std::string, std::shared_ptr<DownloadPipe>> downloads;

    void runCommand(const std::shared_ptr<BackendSession> &session, const std::string &command, Callback<CommandOutput> done);
    void ensureSession(const OperationContext &ctx, Callback<std::shared_ptr<BackendSession>> done);
    void resolveHome(const std::shared_ptr<BackendSession> &session, const std::string &path, Callback<std::string> done);
    void setupOperation(const OperationContext &ctx, const std::string &path, const bool &check_extension, Callback<Setup> done);
    void statPath(const std::shared_ptr<BackendSession> &session, const std::string &path, Callback<FileEntry> done);

    void writeChunk(std::shared_ptr<UploadPipe> pipe, UploadChunkRequest request, std::uint64_t bytes_received, Callback<UploadAck> done);
    void dropUpload(const std::string &transfer_id);
    void finishDownload(const std::string &transfer_id);
};

}
