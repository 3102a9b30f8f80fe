#include "webxfer/transfer_service.hpp"
#include "webxfer/helpers.hpp"

#include <iostream>

namespace webxfer {

TransferService::TransferService(SftpConfig config, ConnectionLookup lookup, Scheduler &scheduler)
    : cfg(std::move(config)),
      scheduler(scheduler),
      transfers(cfg.max_concurrent_transfers, cfg.rate_limit_bytes_per_sec),
      native(cfg, transfers, native_sessions, lookup, scheduler),
      shell(cfg, transfers, shell_sessions, std::move(lookup), scheduler) {
    std::cout << "[service] file transfer " << (this->cfg.enabled ? "enabled" : "disabled")
              << " (backend " << backend_kind_name(this->cfg.backend)
              << ", chunk " << this->cfg.chunk_size << " bytes"
              << ", max " << this->cfg.max_concurrent_transfers << " transfers)" << std::endl;
}

TransferService::~TransferService() {
    this->shutdown();
}

bool TransferService::isEnabled() const {
    return this->cfg.enabled;
}

const SftpConfig &TransferService::config() const {
    return this->cfg;
}

// backend binding

void TransferService::withBackend(const OperationContext &ctx, Callback<FileBackend *> done) {
    if (this->cfg.backend != BackendKind::Auto) {
        FileBackend *backend = this->backendOf(ctx.connection_id);
        this->bindings[ctx.connection_id] = backend;
        done(backend);
        return;
    }
    if (auto it = this->bindings.find(ctx.connection_id); it != this->bindings.end()) {
        done(it->second);
        return;
    }

    this->probing[ctx.connection_id]++;
    this->native.probe(ctx, [this, ctx, done](Result<Ok> probed) {
        auto live = this->probing.find(ctx.connection_id);
        if (live == this->probing.end()) {
            done(make_error(ErrorCode::NoConnection, "SSH connection closed"));
            return;
        }
        if (--live->second == 0) {
            this->probing.erase(live);
        }
        if (auto it = this->bindings.find(ctx.connection_id); it != this->bindings.end()) {
            done(it->second);
            return;
        }
        if (probed.is_ok()) {
            this->bindings[ctx.connection_id] = &this->native;
            std::cout << "[service] connection " << ctx.connection_id << " uses the SFTP subsystem" << std::endl;
            done(&this->native);
            return;
        }
        const Error &err = probed.error();
        if (err.code == ErrorCode::NoConnection || err.code == ErrorCode::NotEnabled) {
            done(err);
            return;
        }
        std::cout << "[service] SFTP subsystem unavailable on connection " << ctx.connection_id
                  << " (" << err.message << "), falling back to shell commands" << std::endl;
        this->bindings[ctx.connection_id] = &this->shell;
        done(&this->shell);
    });
}

FileBackend *TransferService::backendOf(const std::string &connection_id) {
    switch (this->cfg.backend) {
        case BackendKind::Sftp:
            return &this->native;
        case BackendKind::Shell:
            return &this->shell;
        case BackendKind::Auto:
            break;
    }
    auto it = this->bindings.find(connection_id);
    return it == this->bindings.end() ? nullptr : it->second;
}

Result<Transfer> TransferService::owned(const std::string &session_id, const std::string &transfer_id, const char *operation) const {
    auto verified = this->transfers.verifyOwnership(transfer_id, session_id);
    if (verified.is_err()) {
        if (verified.error().code == TransferErrorCode::NotOwner) {
            std::cerr << "[service] security: session " << session_id << " denied " << operation
                      << " on transfer " << transfer_id << " owned by another session" << std::endl;
        }
        return map_transfer_error(verified.error());
    }
    return verified.unwrap();
}

std::string TransferService::resolveTransferId(const std::string &requested) const {
    if (is_valid_transfer_id(requested) && !this->transfers.getTransfer(requested)) {
        return requested;
    }
    return generate_transfer_id();
}

// browsing

void TransferService::listDirectory(const OperationContext &ctx, const std::string &path, const bool &show_hidden, Callback<DirectoryListing> done) {
    auto checked = check_request_path(this->cfg, path, false);
    if (checked.is_err()) {
        done(checked.error());
        return;
    }
    this->withBackend(ctx, [ctx, path, show_hidden, done](Result<FileBackend *> backend) {
        if (backend.is_err()) {
            done(backend.error());
            return;
        }
        backend.unwrap()->listDirectory(ctx, path, show_hidden, done);
    });
}

void TransferService::stat(const OperationContext &ctx, const std::string &path, Callback<StatResult> done) {
    auto checked = check_request_path(this->cfg, path, false);
    if (checked.is_err()) {
        done(checked.error());
        return;
    }
    this->withBackend(ctx, [ctx, path, done](Result<FileBackend *> backend) {
        if (backend.is_err()) {
            done(backend.error());
            return;
        }
        backend.unwrap()->stat(ctx, path, done);
    });
}

void TransferService::mkdir(const OperationContext &ctx, const std::string &path, const std::optional<std::uint32_t> &mode, Callback<OperationResult> done) {
    auto checked = check_request_path(this->cfg, path, false);
    if (checked.is_err()) {
        done(checked.error());
        return;
    }
    if (mode && *mode > 0777) {
        done(make_error(ErrorCode::InvalidRequest, "mode must be between 0 and 0777", path));
        return;
    }
    this->withBackend(ctx, [ctx, path, mode, done](Result<FileBackend *> backend) {
        if (backend.is_err()) {
            done(backend.error());
            return;
        }
        backend.unwrap()->mkdir(ctx, path, mode, done);
    });
}

void TransferService::deletePath(const OperationContext &ctx, const std::string &path, const bool &recursive, Callback<OperationResult> done) {
    auto checked = check_request_path(this->cfg, path, false);
    if (checked.is_err()) {
        done(checked.error());
        return;
    }
    this->withBackend(ctx, [ctx, path, recursive, done](Result<FileBackend *> backend) {
        if (backend.is_err()) {
            done(backend.error());
            return;
        }
        backend.unwrap()->deletePath(ctx, path, recursive, done);
    });
}

// uploads

void TransferService::startUpload(UploadStartRequest request, Callback<UploadReady> done) {
    if (!this->cfg.enabled) {
        done(make_error(ErrorCode::NotEnabled, "File transfer is not enabled"));
        return;
    }
    request.transfer_id = this->resolveTransferId(request.transfer_id);
    const std::string id = request.transfer_id;

    if (request.file_size > this->cfg.max_file_size) {
        done(make_error(ErrorCode::FileTooLarge,
            "File size " + std::to_string(request.file_size) + " exceeds maximum " + std::to_string(this->cfg.max_file_size),
            request.remote_path, id));
        return;
    }
    auto name = validate_file_name(request.file_name);
    if (name.is_err()) {
        done(with_transfer(map_path_error(name.error(), request.file_name), id));
        return;
    }
    auto checked = check_request_path(this->cfg, request.remote_path, true);
    if (checked.is_err()) {
        done(with_transfer(checked.error(), id));
        return;
    }
    if (!this->transfers.canStartTransfer()) {
        done(make_error(ErrorCode::MaxTransfers, "Maximum concurrent transfers reached", request.remote_path, id));
        return;
    }

    OperationContext ctx{request.connection_id, request.session_id};
    this->withBackend(ctx, [request, done](Result<FileBackend *> backend) {
        if (backend.is_err()) {
            done(with_transfer(backend.error(), request.transfer_id));
            return;
        }
        backend.unwrap()->startUpload(request, done);
    });
}

void TransferService::processUploadChunk(const std::string &session_id, UploadChunkRequest request, Callback<UploadAck> acked, Callback<TransferCompletion> completed) {
    auto transfer = this->owned(session_id, request.transfer_id, "upload-chunk");
    if (transfer.is_err()) {
        acked(transfer.error());
        return;
    }
    FileBackend *backend = this->backendOf(transfer.unwrap().connection_id);
    if (transfer.unwrap().direction != TransferDirection::Upload || !backend) {
        acked(make_error(ErrorCode::InvalidRequest, "Transfer not found", "", request.transfer_id));
        return;
    }

    const std::string id = request.transfer_id;
    const bool is_last = request.is_last;
    backend->processUploadChunk(std::move(request), [backend, id, is_last, acked, completed](Result<UploadAck> ack) {
        acked(ack);
        if (ack.is_ok() && is_last) {
            backend->completeUpload(id, completed);
        }
    });
}

void TransferService::completeUpload(const std::string &session_id, const std::string &transfer_id, Callback<TransferCompletion> done) {
    auto transfer = this->owned(session_id, transfer_id, "upload-complete");
    if (transfer.is_err()) {
        done(transfer.error());
        return;
    }
    FileBackend *backend = this->backendOf(transfer.unwrap().connection_id);
    if (!backend) {
        done(make_error(ErrorCode::InvalidRequest, "Transfer not found", "", transfer_id));
        return;
    }
    backend->completeUpload(transfer_id, done);
}

void TransferService::cancelUpload(const std::string &session_id, const std::string &transfer_id) {
    auto transfer = this->owned(session_id, transfer_id, "upload-cancel");
    if (transfer.is_err()) {
        return;
    }
    if (FileBackend *backend = this->backendOf(transfer.unwrap().connection_id)) {
        backend->cancelUpload(transfer_id);
    } else {
        this->transfers.cancelTransfer(transfer_id);
    }
}

// downloads

void TransferService::startDownload(DownloadStartRequest request, Callback<DownloadReady> ready, DownloadCallbacks stream) {
    if (!this->cfg.enabled) {
        ready(make_error(ErrorCode::NotEnabled, "File transfer is not enabled"));
        return;
    }
    request.transfer_id = this->resolveTransferId(request.transfer_id);
    auto checked = check_request_path(this->cfg, request.remote_path, true);
    if (checked.is_err()) {
        ready(with_transfer(checked.error(), request.transfer_id));
        return;
    }
    if (!this->transfers.canStartTransfer()) {
        ready(make_error(ErrorCode::MaxTransfers, "Maximum concurrent transfers reached", request.remote_path, request.transfer_id));
        return;
    }

    OperationContext ctx{request.connection_id, request.session_id};
    this->withBackend(ctx, [request, ready, stream](Result<FileBackend *> backend) {
        if (backend.is_err()) {
            ready(with_transfer(backend.error(), request.transfer_id));
            return;
        }
        FileBackend *b = backend.unwrap();
        b->startDownload(request, [b, ready, stream](Result<DownloadReady> info) {
            ready(info);
            if (info.is_ok()) {
                b->streamDownloadChunks(info.unwrap().transfer_id, stream);
            }
        });
    });
}

void TransferService::cancelDownload(const std::string &session_id, const std::string &transfer_id) {
    auto transfer = this->owned(session_id, transfer_id, "download-cancel");
    if (transfer.is_err()) {
        return;
    }
    if (FileBackend *backend = this->backendOf(transfer.unwrap().connection_id)) {
        backend->cancelDownload(transfer_id);
    } else {
        this->transfers.cancelTransfer(transfer_id);
    }
}

// transfer control

Result<Ok> TransferService::pauseTransfer(const std::string &session_id, const std::string &transfer_id) {
    auto transfer = this->owned(session_id, transfer_id, "pause");
    if (transfer.is_err()) {
        return transfer.error();
    }
    auto paused = this->transfers.pauseTransfer(transfer_id);
    if (paused.is_err()) {
        return map_transfer_error(paused.error());
    }
    std::cout << "[service] transfer " << transfer_id << " paused" << std::endl;
    return Ok{};
}

Result<Ok> TransferService::resumeTransfer(const std::string &session_id, const std::string &transfer_id) {
    auto transfer = this->owned(session_id, transfer_id, "resume");
    if (transfer.is_err()) {
        return transfer.error();
    }
    auto resumed = this->transfers.resumeTransfer(transfer_id);
    if (resumed.is_err()) {
        return map_transfer_error(resumed.error());
    }
    std::cout << "[service] transfer " << transfer_id << " resumed" << std::endl;
    return Ok{};
}

Result<TransferProgress> TransferService::getProgress(const std::string &session_id, const std::string &transfer_id) const {
    auto transfer = this->owned(session_id, transfer_id, "progress");
    if (transfer.is_err()) {
        return transfer.error();
    }
    auto progress = this->transfers.getProgress(transfer_id);
    if (progress.is_err()) {
        return map_transfer_error(progress.error());
    }
    return progress.unwrap();
}

// teardown

void TransferService::disconnect(const std::string &connection_id, const std::string &session_id) {
    const size_t owned_transfers = this->transfers.getSessionTransfers(session_id).size();
    this->bindings.erase(connection_id);
    this->probing.erase(connection_id);
    this->native.closeSession(connection_id);
    this->shell.closeSession(connection_id);
    this->native.cancelSessionTransfers(session_id);
    this->shell.cancelSessionTransfers(session_id);
    std::cout << "[service] connection " << connection_id << " closed, " << owned_transfers << " transfers cancelled" << std::endl;
}

void TransferService::shutdown() {
    std::vector<std::string> connections = this->native_sessions.connectionIds();
    for (const auto &id : this->shell_sessions.connectionIds()) {
        connections.push_back(id);
    }
    for (const auto &[id, count] : this->probing) {
        connections.push_back(id);
    }
    this->bindings.clear();
    this->probing.clear();
    for (const auto &id : connections) {
        this->native.closeSession(id);
        this->shell.closeSession(id);
    }
    const size_t remaining = this->transfers.getTotalCount();
    this->transfers.clear();
    if (!connections.empty() || remaining > 0) {
        std::cout << "[service] shutdown: " << connections.size() << " sessions closed, " << remaining << " transfers dropped" << std::endl;
    }
}

size_t TransferService::activeTransfers() const {
    return this->transfers.getActiveCount();
}

}
