#include "webxfer/native_backend.hpp"
#include "webxfer/mime.hpp"
#include "webxfer/reorder_buffer.hpp"

#include <algorithm>
#include <iostream>

namespace webxfer {

// Depth-first removal of a directory tree, one remote call at a time.
class NativeBackend::TreeRemoval : public std::enable_shared_from_this<TreeRemoval> {
public:
    TreeRemoval(NativeBackend &backend, std::shared_ptr<SftpChannel> sftp, std::string path, std::function<void(RemoteStatus)> done)
        : backend(backend), sftp(std::move(sftp)), path(std::move(path)), done(std::move(done)) {}

    void start() {
        auto self = this->shared_from_this();
        this->sftp->readdir(this->path, with_timeout<std::vector<RemoteDirEntry>>(this->backend.scheduler, this->backend.config.timeout,
            [self](RemoteStatus status, std::vector<RemoteDirEntry> entries) {
                if (status) {
                    self->done(std::move(status));
                    return;
                }
                for (auto &entry : entries) {
                    if (entry.name != "." && entry.name != "..") {
                        self->children.push_back(std::move(entry));
                    }
                }
                self->next();
            }));
    }

private:
    NativeBackend &backend;
    std::shared_ptr<SftpChannel> sftp;
    std::string path;
    std::function<void(RemoteStatus)> done;
    std::vector<RemoteDirEntry> children;
    size_t index = 0;

    void next() {
        auto self = this->shared_from_this();
        if (this->index == this->children.size()) {
            this->sftp->rmdir(this->path, with_timeout(this->backend.scheduler, this->backend.config.timeout,
                [self](RemoteStatus status) {
                    self->done(std::move(status));
                }));
            return;
        }

        const RemoteDirEntry &entry = this->children[this->index++];
        PathResult joined = validate_file_name(entry.name);
        if (joined.is_ok()) {
            joined = join_path_safely(this->path, entry.name);
        }
        if (joined.is_err()) {
            this->done(RemoteError{SSH_FX_FAILURE, "Refusing to remove entry '" + entry.name + "': " + joined.error().message});
            return;
        }
        const std::string child = joined.unwrap();
        auto proceed = [self](RemoteStatus status) {
            if (status) {
                self->done(std::move(status));
                return;
            }
            self->next();
        };

        if (entry_type_from_mode(entry.attrs.mode) == EntryType::Directory) {
            std::make_shared<TreeRemoval>(this->backend, this->sftp, child, proceed)->start();
        } else {
            this->sftp->unlink(child, with_timeout(this->backend.scheduler, this->backend.config.timeout, proceed));
        }
    }
};

// Streams one file with a window of parallel reads. Reads may complete in any
// order; chunks leave through the reorder buffer strictly by index.
class NativeBackend::DownloadJob : public std::enable_shared_from_this<DownloadJob> {
public:
    DownloadJob(NativeBackend &backend, std::shared_ptr<SftpChannel> sftp, const Transfer &transfer, DownloadCallbacks callbacks)
        : backend(backend),
          sftp(std::move(sftp)),
          transfer_id(transfer.id),
          session_id(transfer.session_id),
          connection_id(transfer.connection_id),
          path(transfer.remote_path),
          file_size(transfer.total_bytes),
          chunk_size(backend.config.chunk_size),
          total_chunks(transfer.total_bytes / backend.config.chunk_size + 1),
          token(transfer.cancel_token),
          callbacks(std::move(callbacks)),
          last_progress(std::chrono::steady_clock::now()) {}

    void start() {
        auto self = this->shared_from_this();
        this->sftp->open(this->path, OpenMode::Read, with_timeout<RemoteHandle>(this->backend.scheduler, this->backend.config.timeout,
            [self](RemoteStatus status, RemoteHandle handle) {
                if (status) {
                    Error err = map_remote_error(*status, self->path);
                    if (err.code == ErrorCode::SessionError) {
                        err.code = ErrorCode::PermissionDenied;
                    }
                    self->fail(err);
                    return;
                }
                self->handle = handle;
                self->open = true;
                if (self->stopped) {
                    self->closeHandle();
                    return;
                }
                self->pump();
            }));
    }

    void stop() {
        this->stopped = true;
        if (this->retry_pending) {
            this->backend.scheduler.cancel(this->retry_timer);
            this->retry_pending = false;
        }
        this->closeHandle();
        this->buffer.clear();
    }

    const std::string &sessionId() const {
        return this->session_id;
    }

    const std::string &connectionId() const {
        return this->connection_id;
    }

private:
    NativeBackend &backend;
    std::shared_ptr<SftpChannel> sftp;
    const std::string transfer_id;
    const std::string session_id;
    const std::string connection_id;
    const std::string path;
    const std::uint64_t file_size;
    const std::uint64_t chunk_size;
    const std::uint64_t total_chunks;
    CancellationToken token;
    DownloadCallbacks callbacks;

    RemoteHandle handle = 0;
    bool open = false;
    bool stopped = false;
    bool pumping = false;
    bool repump = false;
    bool retry_pending = false;
    TimerId retry_timer = 0;
    std::uint64_t next_to_read = 0;
    size_t in_flight = 0;
    ReorderBuffer buffer;
    std::chrono::steady_clock::time_point last_progress;

    void pump() {
        if (this->pumping) {
            this->repump = true;
            return;
        }
        this->pumping = true;
        do {
            this->repump = false;
            this->issueReads();
            this->drain();
        } while (this->repump && !this->stopped);
        this->pumping = false;
    }

    void issueReads() {
        while (!this->stopped && this->in_flight < this->backend.config.download_concurrency && this->next_to_read < this->total_chunks) {
            if (this->token.isCancelled()) {
                this->abandon();
                return;
            }

            const std::uint64_t index = this->next_to_read;
            const std::uint64_t offset = index * this->chunk_size;
            const std::uint64_t length = offset >= this->file_size ? 0 : std::min(this->chunk_size, this->file_size - offset);

            // the terminating chunk of an exact multiple has nothing to read
            if (length == 0) {
                this->next_to_read++;
                this->buffer.put(index, "");
                continue;
            }

            auto admitted = this->backend.transfers.admit(this->transfer_id, length);
            if (admitted.is_err()) {
                this->abandon();
                return;
            }
            if (!admitted.unwrap().allowed) {
                this->scheduleRetry(admitted.unwrap().wait_ms);
                return;
            }

            this->next_to_read++;
            this->in_flight++;
            this->read(index, offset, length, "");
        }
    }

    void read(const std::uint64_t &index, const std::uint64_t &offset, const std::uint64_t &length, std::string received) {
        auto self = this->shared_from_this();
        const std::uint64_t position = offset + received.size();
        const size_t wanted = static_cast<size_t>(length - received.size());
        this->sftp->read(this->handle, position, wanted, with_timeout<std::string>(this->backend.scheduler, this->backend.config.timeout,
            [self, index, offset, length, received = std::move(received)](RemoteStatus status, std::string data) mutable {
                if (self->stopped) {
                    return;
                }
                if (status) {
                    Error err = map_remote_error(*status, self->path);
                    if (err.code != ErrorCode::Timeout) {
                        err.code = ErrorCode::ChunkError;
                    }
                    self->fail(err);
                    return;
                }
                if (data.empty()) {
                    self->fail(make_error(ErrorCode::ChunkError, "Unexpected end of file at offset " + std::to_string(offset + received.size()), self->path));
                    return;
                }
                received += data;
                if (received.size() < length) {
                    // short read, fetch the rest of this chunk
                    self->read(index, offset, length, std::move(received));
                    return;
                }
                self->in_flight--;
                self->buffer.put(index, std::move(received));
                self->pump();
            }));
    }

    void drain() {
        while (!this->stopped && this->buffer.ready()) {
            if (this->token.isCancelled()) {
                this->abandon();
                return;
            }

            const std::uint64_t index = this->buffer.nextIndex();
            std::string data = this->buffer.pop();
            auto updated = this->backend.transfers.updateProgress(this->transfer_id, index, data.size());
            if (updated.is_err()) {
                this->fail(map_transfer_error(updated.error()));
                return;
            }

            const bool is_last = index == this->total_chunks - 1;
            this->callbacks.on_chunk(DownloadChunk{this->transfer_id, index, std::move(data), is_last});
            if (this->stopped) {
                return;
            }

            auto now = std::chrono::steady_clock::now();
            if (!is_last && now - this->last_progress >= this->backend.config.progress_interval) {
                this->last_progress = now;
                auto progress = this->backend.transfers.getProgress(this->transfer_id);
                if (progress.is_ok() && this->callbacks.on_progress) {
                    this->callbacks.on_progress(progress.unwrap());
                }
            }

            if (is_last) {
                this->complete();
                return;
            }
        }
    }

    void scheduleRetry(const std::uint64_t &wait_ms) {
        if (this->retry_pending) {
            return;
        }
        auto self = this->shared_from_this();
        this->retry_pending = true;
        this->retry_timer = this->backend.scheduler.schedule(std::chrono::milliseconds(wait_ms), [self]() {
            self->retry_pending = false;
            self->pump();
        });
    }

    void closeHandle() {
        if (!this->open) {
            return;
        }
        this->open = false;
        const std::string id = this->transfer_id;
        this->sftp->close(this->handle, [id](RemoteStatus status) {
            if (status) {
                std::cerr << "[sftp] close failed for download " << id << ": " << status->message << std::endl;
            }
        });
    }

    void complete() {
        this->stop();
        auto completion = this->backend.transfers.completeTransfer(this->transfer_id);
        if (completion.is_err()) {
            this->callbacks.on_error(map_transfer_error(completion.error()));
        } else {
            std::cout << "[sftp] download " << this->transfer_id << " completed: " << completion.unwrap().bytes_transferred
                      << " bytes in " << completion.unwrap().duration_ms << " ms" << std::endl;
            this->callbacks.on_complete(completion.unwrap());
        }
        this->backend.finishDownload(this->transfer_id);
    }

    void fail(const Error &error) {
        if (this->stopped) {
            return;
        }
        this->stop();
        auto failed = this->backend.transfers.failTransfer(this->transfer_id, error.message);
        if (failed.is_err()) {
            std::cerr << "[sftp] download " << this->transfer_id << " already gone: " << failed.error().message << std::endl;
        }
        this->callbacks.on_error(with_transfer(error, this->transfer_id));
        this->backend.finishDownload(this->transfer_id);
    }

    // cancelled elsewhere; nothing left to report
    void abandon() {
        this->stop();
        this->backend.finishDownload(this->transfer_id);
    }
};

NativeBackend::NativeBackend(const SftpConfig &config, TransferManager &transfers, SessionStore &sessions,
                             ConnectionLookup lookup, Scheduler &scheduler)
    : config(config), transfers(transfers), sessions(sessions), lookup(std::move(lookup)), scheduler(scheduler) {}

NativeBackend::~NativeBackend() {
    for (auto &[id, job] : this->downloads) {
        job->stop();
    }
}

const char *NativeBackend::name() const {
    return "sftp";
}

bool NativeBackend::isEnabled() const {
    return this->config.enabled;
}

// sessions and paths

void NativeBackend::ensureSession(const OperationContext &ctx, Callback<std::shared_ptr<BackendSession>> done) {
    if (auto existing = this->sessions.get(ctx.connection_id)) {
        this->sessions.touch(ctx.connection_id);
        done(existing);
        return;
    }

    std::shared_ptr<RemoteConnection> connection = this->lookup ? this->lookup(ctx.connection_id) : nullptr;
    if (!connection) {
        done(make_error(ErrorCode::NoConnection, "No SSH connection available"));
        return;
    }

    // operations racing the first open share its outcome
    auto &waiters = this->pending_sessions[ctx.connection_id];
    waiters.push_back(std::move(done));
    if (waiters.size() > 1) {
        return;
    }

    connection->openSftp(with_timeout<std::shared_ptr<SftpChannel>>(this->scheduler, this->config.timeout,
        [this, ctx, connection](RemoteStatus status, std::shared_ptr<SftpChannel> sftp) {
            auto node = this->pending_sessions.extract(ctx.connection_id);
            if (node.empty()) {
                // the connection was closed while the subsystem was opening
                if (!status && sftp) {
                    sftp->end();
                }
                return;
            }

            auto result = [&]() -> Result<std::shared_ptr<BackendSession>> {
                if (status) {
                    Error err = map_remote_error(*status);
                    if (err.code != ErrorCode::Timeout) {
                        err.code = ErrorCode::SessionError;
                        err.message = "Failed to open SFTP subsystem: " + err.message;
                    }
                    return err;
                }
                if (!sftp) {
                    return make_error(ErrorCode::SessionError, "Failed to open SFTP subsystem");
                }
                auto session = this->sessions.create(ctx.connection_id, ctx.session_id, connection);
                session->sftp = sftp;
                std::cout << "[sftp] session opened for connection " << ctx.connection_id << std::endl;
                return session;
            }();

            for (auto &waiter : node.mapped()) {
                waiter(result);
            }
        }));
}

void NativeBackend::resolveHome(const std::shared_ptr<BackendSession> &session, const std::string &path, Callback<std::string> done) {
    if (!is_home_relative(path)) {
        done(path);
        return;
    }
    if (session->home_dir) {
        done(substitute_home(path, *session->home_dir));
        return;
    }

    session->sftp->realpath(".", with_timeout<std::string>(this->scheduler, this->config.timeout,
        [session, path, done](RemoteStatus status, std::string home) {
            if (status) {
                done(map_remote_error(*status, path));
                return;
            }
            if (home.empty() || home.front() != '/') {
                done(make_error(ErrorCode::SessionError, "Could not resolve home directory", path));
                return;
            }
            session->home_dir = home;
            done(substitute_home(path, home));
        }));
}

void NativeBackend::setupOperation(const OperationContext &ctx, const std::string &path, const bool &check_extension, Callback<Setup> done) {
    auto checked = check_request_path(this->config, path, check_extension);
    if (checked.is_err()) {
        done(checked.error());
        return;
    }

    std::string normalized = checked.unwrap();
    this->ensureSession(ctx, [this, normalized, done](Result<std::shared_ptr<BackendSession>> session) {
        if (session.is_err()) {
            done(session.error());
            return;
        }
        std::shared_ptr<BackendSession> s = session.unwrap();
        this->resolveHome(s, normalized, [s, done](Result<std::string> resolved) {
            if (resolved.is_err()) {
                done(resolved.error());
                return;
            }
            done(Setup{resolved.unwrap(), s});
        });
    });
}

void NativeBackend::probe(const OperationContext &ctx, Callback<Ok> done) {
    if (!this->config.enabled) {
        done(make_error(ErrorCode::NotEnabled, "File transfer is not enabled"));
        return;
    }
    this->ensureSession(ctx, [done](Result<std::shared_ptr<BackendSession>> session) {
        if (session.is_err()) {
            done(session.error());
            return;
        }
        done(Ok{});
    });
}

// browsing

void NativeBackend::listDirectory(const OperationContext &ctx, const std::string &path, const bool &show_hidden, Callback<DirectoryListing> done) {
    this->setupOperation(ctx, path, false, [this, show_hidden, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(setup.error());
            return;
        }
        const std::string dir = setup.unwrap().path;
        setup.unwrap().session->sftp->readdir(dir, with_timeout<std::vector<RemoteDirEntry>>(this->scheduler, this->config.timeout,
            [this, dir, show_hidden, done](RemoteStatus status, std::vector<RemoteDirEntry> raw) {
                if (status) {
                    done(map_remote_error(*status, dir));
                    return;
                }
                DirectoryListing listing;
                listing.path = dir;
                for (const auto &entry : raw) {
                    if (entry.name == "." || entry.name == "..") {
                        continue;
                    }
                    if (!show_hidden && entry.name.starts_with(".")) {
                        continue;
                    }
                    if (listing.entries.size() >= this->config.max_directory_entries) {
                        std::cerr << "[sftp] listing of " << dir << " truncated at " << this->config.max_directory_entries << " entries" << std::endl;
                        break;
                    }
                    listing.entries.push_back(entry_from_attributes(entry.name, join_remote(dir, entry.name), entry.attrs));
                }
                done(std::move(listing));
            }));
    });
}

void NativeBackend::stat(const OperationContext &ctx, const std::string &path, Callback<StatResult> done) {
    this->setupOperation(ctx, path, false, [this, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(setup.error());
            return;
        }
        const std::string target = setup.unwrap().path;
        setup.unwrap().session->sftp->stat(target, with_timeout<RemoteAttributes>(this->scheduler, this->config.timeout,
            [target, done](RemoteStatus status, RemoteAttributes attrs) {
                if (status) {
                    done(map_remote_error(*status, target));
                    return;
                }
                std::string name = base_name(target);
                done(StatResult{target, entry_from_attributes(name.empty() ? target : name, target, attrs)});
            }));
    });
}

void NativeBackend::mkdir(const OperationContext &ctx, const std::string &path, const std::optional<std::uint32_t> &mode, Callback<OperationResult> done) {
    const std::uint32_t dir_mode = mode.value_or(this->config.dir_mode);
    this->setupOperation(ctx, path, false, [this, dir_mode, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(setup.error());
            return;
        }
        const std::string target = setup.unwrap().path;
        setup.unwrap().session->sftp->mkdir(target, dir_mode, with_timeout(this->scheduler, this->config.timeout,
            [target, done](RemoteStatus status) {
                if (status) {
                    done(map_remote_error(*status, target));
                    return;
                }
                std::cout << "[sftp] directory created: " << target << std::endl;
                done(OperationResult{true, target});
            }));
    });
}

void NativeBackend::deletePath(const OperationContext &ctx, const std::string &path, const bool &recursive, Callback<OperationResult> done) {
    this->setupOperation(ctx, path, false, [this, recursive, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(setup.error());
            return;
        }
        const std::string target = setup.unwrap().path;
        std::shared_ptr<SftpChannel> sftp = setup.unwrap().session->sftp;
        sftp->stat(target, with_timeout<RemoteAttributes>(this->scheduler, this->config.timeout,
            [this, sftp, target, recursive, done](RemoteStatus status, RemoteAttributes attrs) {
                if (status) {
                    done(map_remote_error(*status, target));
                    return;
                }
                auto finished = [target, done](RemoteStatus removed) {
                    if (removed) {
                        done(map_remote_error(*removed, target));
                        return;
                    }
                    std::cout << "[sftp] deleted: " << target << std::endl;
                    done(OperationResult{true, target});
                };

                if (entry_type_from_mode(attrs.mode) != EntryType::Directory) {
                    sftp->unlink(target, with_timeout(this->scheduler, this->config.timeout, finished));
                } else if (recursive) {
                    std::make_shared<TreeRemoval>(*this, sftp, target, finished)->start();
                } else {
                    sftp->rmdir(target, with_timeout(this->scheduler, this->config.timeout, finished));
                }
            }));
    });
}

// uploads

void NativeBackend::startUpload(const UploadStartRequest &request, Callback<UploadReady> done) {
    OperationContext ctx{request.connection_id, request.session_id};
    this->setupOperation(ctx, request.remote_path, true, [this, request, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(with_transfer(setup.error(), request.transfer_id));
            return;
        }
        const Setup target = setup.unwrap();

        auto begin = [this, request, target, done]() {
            TransferSpec spec;
            spec.transfer_id = request.transfer_id;
            spec.session_id = request.session_id;
            spec.connection_id = request.connection_id;
            spec.direction = TransferDirection::Upload;
            spec.remote_path = target.path;
            spec.file_name = request.file_name;
            spec.total_bytes = request.file_size;
            spec.rate_limit_bytes_per_sec = this->config.rate_limit_bytes_per_sec;

            auto started = this->transfers.startTransfer(spec);
            if (started.is_err()) {
                done(map_transfer_error(started.error()));
                return;
            }

            CancellationToken token = started.unwrap().cancel_token;
            std::shared_ptr<SftpChannel> sftp = target.session->sftp;
            const OpenMode mode = request.overwrite ? OpenMode::WriteTruncate : OpenMode::WriteExclusive;
            sftp->open(target.path, mode, with_timeout<RemoteHandle>(this->scheduler, this->config.timeout,
                [this, request, path = target.path, sftp, token, done](RemoteStatus status, RemoteHandle handle) {
                    const std::string &id = request.transfer_id;
                    if (status) {
                        this->transfers.cancelTransfer(id);
                        Error err = map_remote_error(*status, path);
                        if (err.code == ErrorCode::SessionError) {
                            err.code = ErrorCode::PermissionDenied;
                        }
                        done(with_transfer(err, id));
                        return;
                    }
                    if (token.isCancelled()) {
                        sftp->close(handle, [](RemoteStatus) {});
                        done(make_error(ErrorCode::TransferCancelled, "Transfer was cancelled", path, id));
                        return;
                    }

                    auto upload = std::make_shared<Upload>();
                    upload->connection_id = request.connection_id;
                    upload->session_id = request.session_id;
                    upload->sftp = sftp;
                    upload->handle = handle;
                    upload->open = true;
                    this->uploads[id] = upload;

                    auto activated = this->transfers.activateTransfer(id);
                    if (activated.is_err()) {
                        this->closeUpload(id);
                        done(map_transfer_error(activated.error()));
                        return;
                    }
                    std::cout << "[sftp] upload " << id << " started: " << path << " (" << request.file_size << " bytes)" << std::endl;
                    done(UploadReady{id, this->config.chunk_size, 1});
                }));
        };

        if (request.overwrite) {
            begin();
            return;
        }
        target.session->sftp->stat(target.path, with_timeout<RemoteAttributes>(this->scheduler, this->config.timeout,
            [request, path = target.path, begin, done](RemoteStatus status, RemoteAttributes) {
                if (!status) {
                    done(make_error(ErrorCode::AlreadyExists, "File already exists", path, request.transfer_id));
                    return;
                }
                begin();
            }));
    });
}

void NativeBackend::processUploadChunk(UploadChunkRequest request, Callback<UploadAck> done) {
    auto it = this->uploads.find(request.transfer_id);
    if (it == this->uploads.end()) {
        done(make_error(ErrorCode::InvalidRequest, "Transfer not found or already completed", "", request.transfer_id));
        return;
    }
    std::shared_ptr<Upload> upload = it->second;
    if (upload->busy || !upload->open) {
        done(make_error(ErrorCode::ChunkError, "Upload is not accepting chunks", "", request.transfer_id));
        return;
    }
    auto transfer = this->transfers.getTransfer(request.transfer_id);
    if (transfer && transfer->next_chunk_index == request.chunk_index) {
        if (auto bounds = check_chunk_bounds(*transfer, request.data.size(), request.is_last)) {
            done(*bounds);
            return;
        }
    }

    auto updated = this->transfers.updateProgress(request.transfer_id, request.chunk_index, request.data.size());
    if (updated.is_err()) {
        done(map_transfer_error(updated.error()));
        return;
    }

    const std::uint64_t bytes_received = updated.unwrap().bytes_transferred;
    const std::uint64_t offset = bytes_received - request.data.size();
    upload->busy = true;
    this->writeChunk(upload, std::move(request), offset, bytes_received, std::move(done));
}

void NativeBackend::writeChunk(std::shared_ptr<Upload> upload, UploadChunkRequest request, std::uint64_t offset, std::uint64_t bytes_received, Callback<UploadAck> done) {
    const std::string id = request.transfer_id;
    auto transfer = this->transfers.getTransfer(id);
    if (!transfer || transfer->cancel_token.isCancelled()) {
        upload->busy = false;
        done(make_error(ErrorCode::TransferCancelled, "Transfer was cancelled", "", id));
        return;
    }

    auto admitted = this->transfers.admit(id, request.data.size());
    if (admitted.is_ok() && !admitted.unwrap().allowed) {
        // hold the ack until the window has room
        this->scheduler.schedule(std::chrono::milliseconds(admitted.unwrap().wait_ms),
            [this, upload, request, offset, bytes_received, done]() {
                this->writeChunk(upload, request, offset, bytes_received, done);
            });
        return;
    }

    const std::uint64_t chunk_index = request.chunk_index;
    const bool is_last = request.is_last;
    upload->sftp->write(upload->handle, offset, std::move(request.data), with_timeout(this->scheduler, this->config.timeout,
        [this, upload, id, chunk_index, is_last, bytes_received, done](RemoteStatus status) {
            if (status) {
                Error err = map_remote_error(*status);
                if (err.code != ErrorCode::Timeout) {
                    err.code = ErrorCode::ChunkError;
                }
                upload->busy = false;
                this->closeUpload(id);
                auto failed = this->transfers.failTransfer(id, err.message);
                if (failed.is_err()) {
                    std::cerr << "[sftp] upload " << id << " already gone" << std::endl;
                }
                done(with_transfer(err, id));
                return;
            }

            UploadAck ack{id, chunk_index, bytes_received};
            if (!is_last) {
                upload->busy = false;
                done(ack);
                return;
            }

            upload->open = false;
            upload->sftp->close(upload->handle, with_timeout(this->scheduler, this->config.timeout,
                [this, upload, id, ack, done](RemoteStatus closed) {
                    upload->busy = false;
                    if (closed) {
                        Error err = map_remote_error(*closed);
                        if (err.code != ErrorCode::Timeout) {
                            err.code = ErrorCode::ChunkError;
                        }
                        this->uploads.erase(id);
                        auto failed = this->transfers.failTransfer(id, err.message);
                        if (failed.is_err()) {
                            std::cerr << "[sftp] upload " << id << " already gone" << std::endl;
                        }
                        done(with_transfer(err, id));
                        return;
                    }
                    done(ack);
                }));
        }));
}

void NativeBackend::completeUpload(const std::string &transfer_id, Callback<TransferCompletion> done) {
    auto it = this->uploads.find(transfer_id);
    auto transfer = this->transfers.getTransfer(transfer_id);
    if (it == this->uploads.end() || !transfer) {
        done(make_error(ErrorCode::InvalidRequest, "Transfer not found", "", transfer_id));
        return;
    }
    if (transfer->bytes_transferred != transfer->total_bytes) {
        done(make_error(ErrorCode::ChunkError,
            "Upload incomplete: received " + std::to_string(transfer->bytes_transferred) + " of " + std::to_string(transfer->total_bytes) + " bytes",
            transfer->remote_path, transfer_id));
        return;
    }

    auto finish = [this, transfer_id, done]() {
        this->uploads.erase(transfer_id);
        auto completion = this->transfers.completeTransfer(transfer_id);
        if (completion.is_err()) {
            done(map_transfer_error(completion.error()));
            return;
        }
        std::cout << "[sftp] upload " << transfer_id << " completed: " << completion.unwrap().bytes_transferred << " bytes" << std::endl;
        done(completion.unwrap());
    };

    std::shared_ptr<Upload> upload = it->second;
    if (!upload->open) {
        finish();
        return;
    }
    upload->open = false;
    upload->sftp->close(upload->handle, with_timeout(this->scheduler, this->config.timeout,
        [this, transfer_id, finish, done](RemoteStatus status) {
            if (status) {
                this->uploads.erase(transfer_id);
                auto failed = this->transfers.failTransfer(transfer_id, status->message);
                if (failed.is_err()) {
                    std::cerr << "[sftp] upload " << transfer_id << " already gone" << std::endl;
                }
                done(with_transfer(map_remote_error(*status), transfer_id));
                return;
            }
            finish();
        }));
}

void NativeBackend::cancelUpload(const std::string &transfer_id) {
    this->closeUpload(transfer_id);
    this->transfers.cancelTransfer(transfer_id);
    std::cout << "[sftp] upload " << transfer_id << " cancelled" << std::endl;
}

void NativeBackend::closeUpload(const std::string &transfer_id) {
    auto node = this->uploads.extract(transfer_id);
    if (node.empty()) {
        return;
    }
    std::shared_ptr<Upload> upload = node.mapped();
    if (!upload->open) {
        return;
    }
    upload->open = false;
    upload->sftp->close(upload->handle, [transfer_id](RemoteStatus status) {
        if (status) {
            std::cerr << "[sftp] close failed for upload " << transfer_id << ": " << status->message << std::endl;
        }
    });
}

// downloads

void NativeBackend::startDownload(const DownloadStartRequest &request, Callback<DownloadReady> done) {
    OperationContext ctx{request.connection_id, request.session_id};
    this->setupOperation(ctx, request.remote_path, true, [this, request, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(with_transfer(setup.error(), request.transfer_id));
            return;
        }
        const std::string target = setup.unwrap().path;
        setup.unwrap().session->sftp->stat(target, with_timeout<RemoteAttributes>(this->scheduler, this->config.timeout,
            [this, request, target, done](RemoteStatus status, RemoteAttributes attrs) {
                const std::string &id = request.transfer_id;
                if (status) {
                    done(with_transfer(map_remote_error(*status, target), id));
                    return;
                }
                if (entry_type_from_mode(attrs.mode) != EntryType::File) {
                    done(make_error(ErrorCode::InvalidRequest, "Can only download files", target, id));
                    return;
                }
                if (attrs.size > this->config.max_file_size) {
                    done(make_error(ErrorCode::FileTooLarge,
                        "File size " + std::to_string(attrs.size) + " exceeds maximum " + std::to_string(this->config.max_file_size), target, id));
                    return;
                }

                TransferSpec spec;
                spec.transfer_id = id;
                spec.session_id = request.session_id;
                spec.connection_id = request.connection_id;
                spec.direction = TransferDirection::Download;
                spec.remote_path = target;
                spec.file_name = base_name(target);
                spec.total_bytes = attrs.size;
                spec.rate_limit_bytes_per_sec = this->config.rate_limit_bytes_per_sec;

                auto started = this->transfers.startTransfer(spec);
                if (started.is_err()) {
                    done(map_transfer_error(started.error()));
                    return;
                }
                auto activated = this->transfers.activateTransfer(id);
                if (activated.is_err()) {
                    done(map_transfer_error(activated.error()));
                    return;
                }
                std::cout << "[sftp] download " << id << " started: " << target << " (" << attrs.size << " bytes)" << std::endl;
                done(DownloadReady{id, spec.file_name, attrs.size, mime_type_for(spec.file_name)});
            }));
    });
}

void NativeBackend::streamDownloadChunks(const std::string &transfer_id, DownloadCallbacks callbacks) {
    auto transfer = this->transfers.getTransfer(transfer_id);
    if (!transfer || transfer->direction != TransferDirection::Download) {
        callbacks.on_error(make_error(ErrorCode::InvalidRequest, "Transfer not found", "", transfer_id));
        return;
    }
    if (this->downloads.contains(transfer_id)) {
        callbacks.on_error(make_error(ErrorCode::InvalidRequest, "Download is already streaming", "", transfer_id));
        return;
    }
    auto session = this->sessions.get(transfer->connection_id);
    if (!session || !session->sftp) {
        this->transfers.cancelTransfer(transfer_id);
        callbacks.on_error(make_error(ErrorCode::NoConnection, "SFTP session not found", "", transfer_id));
        return;
    }

    auto job = std::make_shared<DownloadJob>(*this, session->sftp, *transfer, std::move(callbacks));
    this->downloads[transfer_id] = job;
    job->start();
}

void NativeBackend::cancelDownload(const std::string &transfer_id) {
    auto node = this->downloads.extract(transfer_id);
    if (!node.empty()) {
        node.mapped()->stop();
    }
    this->transfers.cancelTransfer(transfer_id);
    std::cout << "[sftp] download " << transfer_id << " cancelled" << std::endl;
}

void NativeBackend::finishDownload(const std::string &transfer_id) {
    this->downloads.erase(transfer_id);
}

size_t NativeBackend::activeDownloads() const {
    return this->downloads.size();
}

// teardown

void NativeBackend::closeSession(const std::string &connection_id) {
    for (auto it = this->downloads.begin(); it != this->downloads.end();) {
        if (it->second->connectionId() == connection_id) {
            it->second->stop();
            it = this->downloads.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = this->uploads.begin(); it != this->uploads.end();) {
        if (it->second->connection_id == connection_id) {
            it = this->uploads.erase(it);
        } else {
            ++it;
        }
    }

    std::shared_ptr<BackendSession> session = this->sessions.remove(connection_id);
    if (session && session->sftp) {
        session->sftp->end();
        std::cout << "[sftp] session closed for connection " << connection_id << std::endl;
    }

    auto opening = this->pending_sessions.extract(connection_id);
    if (!opening.empty()) {
        std::cout << "[sftp] connection " << connection_id << " closed while opening the subsystem" << std::endl;
        for (auto &waiter : opening.mapped()) {
            waiter(make_error(ErrorCode::SessionError, "SSH connection closed"));
        }
    }
}

void NativeBackend::cancelSessionTransfers(const std::string &session_id) {
    for (auto it = this->downloads.begin(); it != this->downloads.end();) {
        if (it->second->sessionId() == session_id) {
            it->second->stop();
            it = this->downloads.erase(it);
        } else {
            ++it;
        }
    }
    std::vector<std::string> stale;
    for (const auto &[id, upload] : this->uploads) {
        if (upload->session_id == session_id) {
            stale.push_back(id);
        }
    }
    for (const auto &id : stale) {
        this->closeUpload(id);
    }
    this->transfers.cancelSessionTransfers(session_id);
}

}
