#pragma once

#include "backend_common.hpp"
#include "file_backend.hpp"
#include "session_store.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace webxfer {

// Backend speaking the remote SFTP subsystem directly.
class NativeBackend : public FileBackend {
public:
    NativeBackend(const SftpConfig &config, TransferManager &transfers, SessionStore &sessions,
                  ConnectionLookup lookup, Scheduler &scheduler);
    ~NativeBackend() override;

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

    // Opens (and caches) the SFTP subsystem for a connection; fails when the host has none.
    void probe(const OperationContext &ctx, Callback<Ok> done);

    size_t activeDownloads() const;

private:
    struct Setup {
        std::string path;
        std::shared_ptr<BackendSession> session;
    };

    struct Upload {
        std::string connection_id;
        std::string session_id;
        std::shared_ptr<SftpChannel> sftp;
        RemoteHandle handle = 0;
        bool open = false;
        bool busy = false;
    };

    class DownloadJob;
    class TreeRemoval;

    const SftpConfig &config;
    TransferManager &transfers;
    SessionStore &sessions;
    ConnectionLookup lookup;
    Scheduler &scheduler;

    std::unordered_map<std::string, std::vector<Callback<std::shared_ptr<BackendSession>>>> pending_sessions;
    std::unordered_map<std::string, std::shared_ptr<Upload>> uploads;
    std::unordered_map<std::string, std::shared_ptr<DownloadJob>> downloads;

    void ensureSession(const OperationContext &ctx, Callback<std::shared_ptr<BackendSession>> done);
    void resolveHome(const std::shared_ptr<BackendSession> &session, const std::string &path, Callback<std::string> done);
    void setupOperation(const OperationContext &ctx, const std::string &path, const bool &check_extension, Callback<Setup> done);

    void writeChunk(std::shared_ptr<Upload> upload, UploadChunkRequest request, std::uint64_t offset, std::uint64_t bytes_received, Callback<UploadAck> done);
    void closeUpload(const std::string &transfer_id);
    void finishDownload(const std::string &transfer_id);
};

}
