#include "webxfer/shell_backend.hpp"
#include "webxfer/mime.hpp"
#include "webxfer/shell_commands.hpp"

#include <ctime>
#include <deque>
#include <iostream>

namespace webxfer {

// Streams `cat <file>` output, cut into fixed-size chunks. The remainder left
// when the command exits is always sent as the final chunk, even when empty.
// Reading stops while READ_AHEAD_CHUNKS chunks wait for admission.
class ShellBackend::DownloadPipe : public std::enable_shared_from_this<DownloadPipe> {
public:
    static constexpr size_t READ_AHEAD_CHUNKS = 4;

    DownloadPipe(ShellBackend &backend, const Transfer &transfer, DownloadCallbacks callbacks)
        : backend(backend),
          transfer_id(transfer.id),
          session_id(transfer.session_id),
          connection_id(transfer.connection_id),
          path(transfer.remote_path),
          chunk_size(backend.config.chunk_size),
          token(transfer.cancel_token),
          callbacks(std::move(callbacks)),
          last_progress(std::chrono::steady_clock::now()) {}

    void start(const std::shared_ptr<RemoteConnection> &connection) {
        auto self = this->shared_from_this();
        connection->exec(build_read_command(this->path), with_timeout<std::shared_ptr<ExecChannel>>(this->backend.scheduler, this->backend.config.timeout,
            [self](RemoteStatus status, std::shared_ptr<ExecChannel> channel) {
                if (self->stopped) {
                    if (channel) {
                        channel->destroy();
                    }
                    return;
                }
                if (status || !channel) {
                    self->fail(status ? map_remote_error(*status, self->path) : make_error(ErrorCode::SessionError, "Failed to start remote command", self->path));
                    return;
                }

                self->channel = channel;
                std::weak_ptr<DownloadPipe> weak = self;
                channel->onData([weak](const std::string &data) {
                    if (auto pipe = weak.lock()) {
                        pipe->receive(data);
                    }
                });
                channel->onStderr([weak](const std::string &data) {
                    if (auto pipe = weak.lock()) {
                        pipe->stderr_text += data;
                    }
                });
                channel->onError([weak](const RemoteError &error) {
                    if (auto pipe = weak.lock()) {
                        pipe->fail(map_remote_error(error, pipe->path));
                    }
                });
                channel->onClose([weak](int exit_code) {
                    if (auto pipe = weak.lock()) {
                        pipe->closed(exit_code);
                    }
                });
                self->armIdle();
            }));
    }

    void stop() {
        this->stopped = true;
        if (this->retry_pending) {
            this->backend.scheduler.cancel(this->retry_timer);
            this->retry_pending = false;
        }
        if (this->idle_pending) {
            this->backend.scheduler.cancel(this->idle_timer);
            this->idle_pending = false;
        }
        if (this->channel && !this->exited) {
            this->channel->destroy();
        }
        this->pending.clear();
        this->ready.clear();
    }

    const std::string &sessionId() const {
        return this->session_id;
    }

    const std::string &connectionId() const {
        return this->connection_id;
    }

private:
    ShellBackend &backend;
    const std::string transfer_id;
    const std::string session_id;
    const std::string connection_id;
    const std::string path;
    const std::uint64_t chunk_size;
    CancellationToken token;
    DownloadCallbacks callbacks;

    std::shared_ptr<ExecChannel> channel;
    std::string pending;
    std::deque<std::string> ready;
    std::string stderr_text;
    std::uint64_t next_index = 0;
    bool exited = false;
    bool final_queued = false;
    bool stopped = false;
    bool flushing = false;
    bool retry_pending = false;
    bool idle_pending = false;
    bool reads_paused = false;
    TimerId retry_timer = 0;
    TimerId idle_timer = 0;
    std::chrono::steady_clock::time_point last_progress;

    void receive(const std::string &data) {
        if (this->stopped) {
            return;
        }
        this->armIdle();
        this->pending += data;
        while (this->pending.size() >= this->chunk_size) {
            this->ready.push_back(this->pending.substr(0, this->chunk_size));
            this->pending.erase(0, this->chunk_size);
        }
        this->flush();
        this->throttle();
    }

    void closed(const int &exit_code) {
        this->exited = true;
        if (this->idle_pending) {
            this->backend.scheduler.cancel(this->idle_timer);
            this->idle_pending = false;
        }
        if (this->stopped) {
            return;
        }
        if (exit_code != 0) {
            this->fail(map_command_error(this->stderr_text, exit_code, this->path));
            return;
        }
        this->ready.push_back(std::move(this->pending));
        this->pending.clear();
        this->final_queued = true;
        this->flush();
    }

    void flush() {
        if (this->flushing) {
            return;
        }
        this->flushing = true;
        auto self = this->shared_from_this();
        while (!this->stopped && !this->ready.empty()) {
            if (this->token.isCancelled()) {
                this->abandon();
                break;
            }

            auto admitted = this->backend.transfers.admit(this->transfer_id, this->ready.front().size());
            if (admitted.is_err()) {
                this->abandon();
                break;
            }
            if (!admitted.unwrap().allowed) {
                this->scheduleRetry(admitted.unwrap().wait_ms);
                break;
            }

            std::string data = std::move(this->ready.front());
            this->ready.pop_front();
            const std::uint64_t index = this->next_index++;
            auto updated = this->backend.transfers.updateProgress(this->transfer_id, index, data.size());
            if (updated.is_err()) {
                this->fail(map_transfer_error(updated.error()));
                break;
            }

            const bool is_last = this->final_queued && this->ready.empty();
            this->callbacks.on_chunk(DownloadChunk{this->transfer_id, index, std::move(data), is_last});
            if (this->stopped) {
                break;
            }
            if (is_last) {
                this->complete();
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (now - this->last_progress >= this->backend.config.progress_interval) {
                this->last_progress = now;
                auto progress = this->backend.transfers.getProgress(this->transfer_id);
                if (progress.is_ok() && this->callbacks.on_progress) {
                    this->callbacks.on_progress(progress.unwrap());
                }
            }
        }
        this->flushing = false;
        this->throttle();
    }

    void throttle() {
        if (this->stopped || this->exited || !this->channel) {
            return;
        }
        if (!this->reads_paused && this->ready.size() >= READ_AHEAD_CHUNKS) {
            this->reads_paused = true;
            if (this->idle_pending) {
                this->backend.scheduler.cancel(this->idle_timer);
                this->idle_pending = false;
            }
            this->channel->pauseReads();
        } else if (this->reads_paused && this->ready.size() < READ_AHEAD_CHUNKS) {
            this->reads_paused = false;
            this->armIdle();
            this->channel->resumeReads();
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
            self->flush();
        });
    }

    // the remote side must keep producing output while the command runs
    void armIdle() {
        if (this->idle_pending) {
            this->backend.scheduler.cancel(this->idle_timer);
        }
        auto self = this->shared_from_this();
        this->idle_pending = true;
        this->idle_timer = this->backend.scheduler.schedule(this->backend.config.timeout, [self]() {
            self->idle_pending = false;
            self->fail(make_error(ErrorCode::Timeout, "Download stalled", self->path));
        });
    }

    void complete() {
        this->stop();
        auto completion = this->backend.transfers.completeTransfer(this->transfer_id);
        if (completion.is_err()) {
            this->callbacks.on_error(map_transfer_error(completion.error()));
        } else {
            std::cout << "[shell] download " << this->transfer_id << " completed: " << completion.unwrap().bytes_transferred
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
            std::cerr << "[shell] download " << this->transfer_id << " already gone: " << failed.error().message << std::endl;
        }
        this->callbacks.on_error(with_transfer(error, this->transfer_id));
        this->backend.finishDownload(this->transfer_id);
    }

    void abandon() {
        this->stop();
        this->backend.finishDownload(this->transfer_id);
    }
};

ShellBackend::ShellBackend(const SftpConfig &config, TransferManager &transfers, SessionStore &sessions,
                           ConnectionLookup lookup, Scheduler &scheduler)
    : config(config), transfers(transfers), sessions(sessions), lookup(std::move(lookup)), scheduler(scheduler) {}

ShellBackend::~ShellBackend() {
    for (auto &[id, pipe] : this->downloads) {
        pipe->stop();
    }
    for (auto &[id, upload] : this->uploads) {
        if (!upload->closed) {
            upload->channel->destroy();
        }
    }
}

const char *ShellBackend::name() const {
    return "shell";
}

bool ShellBackend::isEnabled() const {
    return this->config.enabled;
}

// commands and sessions

void ShellBackend::runCommand(const std::shared_ptr<BackendSession> &session, const std::string &command, Callback<CommandOutput> done) {
    struct State {
        std::shared_ptr<ExecChannel> channel;
        CommandOutput output;
        bool finished = false;
        TimerId timer = 0;
        Callback<CommandOutput> done;
    };
    auto state = std::make_shared<State>();
    state->done = std::move(done);

    Scheduler *sched = &this->scheduler;
    auto finish = [state, sched](Result<CommandOutput> result) {
        if (state->finished) {
            return;
        }
        state->finished = true;
        sched->cancel(state->timer);
        state->channel.reset();
        Callback<CommandOutput> callback = std::move(state->done);
        callback(std::move(result));
    };

    state->timer = this->scheduler.schedule(this->config.timeout, [state, finish]() {
        if (state->finished) {
            return;
        }
        if (state->channel) {
            state->channel->destroy();
        }
        finish(make_error(ErrorCode::Timeout, "Command timed out"));
    });

    session->connection->exec(command, [state, finish](RemoteStatus status, std::shared_ptr<ExecChannel> channel) {
        if (state->finished) {
            if (channel) {
                channel->destroy();
            }
            return;
        }
        if (status || !channel) {
            finish(status ? map_remote_error(*status) : make_error(ErrorCode::SessionError, "Failed to start remote command"));
            return;
        }
        state->channel = channel;
        channel->onData([state](const std::string &data) {
            state->output.out += data;
        });
        channel->onStderr([state](const std::string &data) {
            state->output.err += data;
        });
        channel->onError([finish](const RemoteError &error) {
            finish(map_remote_error(error));
        });
        channel->onClose([state, finish](int exit_code) {
            state->output.exit_code = exit_code;
            finish(state->output);
        });
    });
}

void ShellBackend::ensureSession(const OperationContext &ctx, Callback<std::shared_ptr<BackendSession>> done) {
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
    std::cout << "[shell] session opened for connection " << ctx.connection_id << std::endl;
    done(this->sessions.create(ctx.connection_id, ctx.session_id, connection));
}

void ShellBackend::resolveHome(const std::shared_ptr<BackendSession> &session, const std::string &path, Callback<std::string> done) {
    if (!is_home_relative(path)) {
        done(path);
        return;
    }
    if (session->home_dir) {
        done(substitute_home(path, *session->home_dir));
        return;
    }

    this->runCommand(session, build_home_command(), [session, path, done](Result<CommandOutput> output) {
        if (output.is_err()) {
            done(output.error());
            return;
        }
        const CommandOutput &result = output.unwrap();
        if (result.exit_code != 0) {
            done(map_command_error(result.err, result.exit_code, path));
            return;
        }
        std::string home = resolve_home_path(result.out);
        if (home.empty() || home.front() != '/') {
            done(make_error(ErrorCode::SessionError, "Could not resolve home directory", path));
            return;
        }
        session->home_dir = home;
        done(substitute_home(path, home));
    });
}

void ShellBackend::setupOperation(const OperationContext &ctx, const std::string &path, const bool &check_extension, Callback<Setup> done) {
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

void ShellBackend::statPath(const std::shared_ptr<BackendSession> &session, const std::string &path, Callback<FileEntry> done) {
    this->runCommand(session, build_stat_command(path), [path, done](Result<CommandOutput> output) {
        if (output.is_err()) {
            done(output.error());
            return;
        }
        const CommandOutput &result = output.unwrap();
        if (result.exit_code != 0) {
            done(map_command_error(result.err, result.exit_code, path));
            return;
        }
        auto entry = parse_stat_entry(result.out, path, std::time(nullptr));
        if (!entry) {
            done(make_error(ErrorCode::SessionError, "Unable to parse stat output", path));
            return;
        }
        done(*entry);
    });
}

// browsing

void ShellBackend::listDirectory(const OperationContext &ctx, const std::string &path, const bool &show_hidden, Callback<DirectoryListing> done) {
    this->setupOperation(ctx, path, false, [this, show_hidden, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(setup.error());
            return;
        }
        const std::string dir = setup.unwrap().path;
        this->runCommand(setup.unwrap().session, build_list_command(dir, show_hidden), [this, dir, show_hidden, done](Result<CommandOutput> output) {
            if (output.is_err()) {
                done(output.error());
                return;
            }
            const CommandOutput &result = output.unwrap();
            if (result.exit_code != 0) {
                done(map_command_error(result.err, result.exit_code, dir));
                return;
            }
            DirectoryListing listing;
            listing.path = dir;
            for (auto &entry : parse_directory_listing(result.out, dir, std::time(nullptr))) {
                if (!show_hidden && entry.is_hidden) {
                    continue;
                }
                if (listing.entries.size() >= this->config.max_directory_entries) {
                    std::cerr << "[shell] listing of " << dir << " truncated at " << this->config.max_directory_entries << " entries" << std::endl;
                    break;
                }
                listing.entries.push_back(std::move(entry));
            }
            done(std::move(listing));
        });
    });
}

void ShellBackend::stat(const OperationContext &ctx, const std::string &path, Callback<StatResult> done) {
    this->setupOperation(ctx, path, false, [this, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(setup.error());
            return;
        }
        const std::string target = setup.unwrap().path;
        this->statPath(setup.unwrap().session, target, [target, done](Result<FileEntry> entry) {
            if (entry.is_err()) {
                done(entry.error());
                return;
            }
            done(StatResult{target, entry.unwrap()});
        });
    });
}

void ShellBackend::mkdir(const OperationContext &ctx, const std::string &path, const std::optional<std::uint32_t> &mode, Callback<OperationResult> done) {
    const std::uint32_t dir_mode = mode.value_or(this->config.dir_mode);
    this->setupOperation(ctx, path, false, [this, dir_mode, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(setup.error());
            return;
        }
        const std::string target = setup.unwrap().path;
        this->runCommand(setup.unwrap().session, build_mkdir_command(target, dir_mode), [target, done](Result<CommandOutput> output) {
            if (output.is_err()) {
                done(output.error());
                return;
            }
            if (output.unwrap().exit_code != 0) {
                done(map_command_error(output.unwrap().err, output.unwrap().exit_code, target));
                return;
            }
            std::cout << "[shell] directory created: " << target << std::endl;
            done(OperationResult{true, target});
        });
    });
}

void ShellBackend::deletePath(const OperationContext &ctx, const std::string &path, const bool &recursive, Callback<OperationResult> done) {
    this->setupOperation(ctx, path, false, [this, recursive, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(setup.error());
            return;
        }
        const std::string target = setup.unwrap().path;
        std::shared_ptr<BackendSession> session = setup.unwrap().session;
        this->statPath(session, target, [this, session, target, recursive, done](Result<FileEntry> entry) {
            if (entry.is_err()) {
                done(entry.error());
                return;
            }
            const std::string command = entry.unwrap().type == EntryType::Directory
                ? build_remove_dir_command(target, recursive)
                : build_remove_file_command(target);
            this->runCommand(session, command, [target, done](Result<CommandOutput> output) {
                if (output.is_err()) {
                    done(output.error());
                    return;
                }
                if (output.unwrap().exit_code != 0) {
                    done(map_command_error(output.unwrap().err, output.unwrap().exit_code, target));
                    return;
                }
                std::cout << "[shell] deleted: " << target << std::endl;
                done(OperationResult{true, target});
            });
        });
    });
}

// uploads

void ShellBackend::startUpload(const UploadStartRequest &request, Callback<UploadReady> done) {
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
            const std::string command = build_write_command(target.path, request.overwrite);
            target.session->connection->exec(command, with_timeout<std::shared_ptr<ExecChannel>>(this->scheduler, this->config.timeout,
                [this, request, path = target.path, token, done](RemoteStatus status, std::shared_ptr<ExecChannel> channel) {
                    const std::string &id = request.transfer_id;
                    if (status || !channel) {
                        this->transfers.cancelTransfer(id);
                        Error err = status ? map_remote_error(*status, path) : make_error(ErrorCode::SessionError, "Failed to start remote command", path);
                        if (err.code == ErrorCode::SessionError) {
                            err.code = ErrorCode::PermissionDenied;
                        }
                        done(with_transfer(err, id));
                        return;
                    }
                    if (token.isCancelled()) {
                        channel->destroy();
                        done(make_error(ErrorCode::TransferCancelled, "Transfer was cancelled", path, id));
                        return;
                    }

                    auto pipe = std::make_shared<UploadPipe>();
                    pipe->session_id = request.session_id;
                    pipe->connection_id = request.connection_id;
                    pipe->path = path;
                    pipe->channel = channel;

                    std::weak_ptr<UploadPipe> weak = pipe;
                    channel->onStderr([weak](const std::string &data) {
                        if (auto p = weak.lock()) {
                            p->stderr_text += data;
                        }
                    });
                    channel->onError([weak](const RemoteError &error) {
                        if (auto p = weak.lock()) {
                            p->error = error;
                            p->closed = true;
                            if (auto waiter = std::move(p->on_closed)) {
                                waiter();
                            }
                        }
                    });
                    channel->onClose([weak](int exit_code) {
                        if (auto p = weak.lock()) {
                            p->exit_code = exit_code;
                            p->closed = true;
                            if (auto waiter = std::move(p->on_closed)) {
                                waiter();
                            }
                        }
                    });
                    this->uploads[id] = pipe;

                    auto activated = this->transfers.activateTransfer(id);
                    if (activated.is_err()) {
                        this->dropUpload(id);
                        done(map_transfer_error(activated.error()));
                        return;
                    }
                    std::cout << "[shell] upload " << id << " started: " << path << " (" << request.file_size << " bytes)" << std::endl;
                    done(UploadReady{id, this->config.chunk_size, 1});
                }));
        };

        if (request.overwrite) {
            begin();
            return;
        }
        this->statPath(target.session, target.path, [request, path = target.path, begin, done](Result<FileEntry> entry) {
            if (entry.is_ok()) {
                done(make_error(ErrorCode::AlreadyExists, "File already exists", path, request.transfer_id));
                return;
            }
            begin();
        });
    });
}

void ShellBackend::processUploadChunk(UploadChunkRequest request, Callback<UploadAck> done) {
    auto it = this->uploads.find(request.transfer_id);
    if (it == this->uploads.end()) {
        done(make_error(ErrorCode::InvalidRequest, "Transfer not found or already completed", "", request.transfer_id));
        return;
    }
    std::shared_ptr<UploadPipe> pipe = it->second;
    const std::string id = request.transfer_id;
    if (pipe->busy || pipe->ended) {
        done(make_error(ErrorCode::ChunkError, "Upload is not accepting chunks", "", id));
        return;
    }
    if (pipe->closed) {
        Error err = pipe->error ? map_remote_error(*pipe->error, pipe->path)
                                : map_command_error(pipe->stderr_text, pipe->exit_code == 0 ? 1 : pipe->exit_code, pipe->path);
        this->uploads.erase(id);
        auto failed = this->transfers.failTransfer(id, err.message);
        if (failed.is_err()) {
            std::cerr << "[shell] upload " << id << " already gone" << std::endl;
        }
        done(with_transfer(err, id));
        return;
    }

    auto transfer = this->transfers.getTransfer(id);
    if (transfer && transfer->next_chunk_index == request.chunk_index) {
        if (auto bounds = check_chunk_bounds(*transfer, request.data.size(), request.is_last)) {
            done(*bounds);
            return;
        }
    }

    auto updated = this->transfers.updateProgress(id, request.chunk_index, request.data.size());
    if (updated.is_err()) {
        done(map_transfer_error(updated.error()));
        return;
    }

    pipe->busy = true;
    this->writeChunk(pipe, std::move(request), updated.unwrap().bytes_transferred, std::move(done));
}

void ShellBackend::writeChunk(std::shared_ptr<UploadPipe> pipe, UploadChunkRequest request, std::uint64_t bytes_received, Callback<UploadAck> done) {
    const std::string id = request.transfer_id;
    auto transfer = this->transfers.getTransfer(id);
    if (!transfer || transfer->cancel_token.isCancelled()) {
        pipe->busy = false;
        done(make_error(ErrorCode::TransferCancelled, "Transfer was cancelled", "", id));
        return;
    }

    auto admitted = this->transfers.admit(id, request.data.size());
    if (admitted.is_ok() && !admitted.unwrap().allowed) {
        this->scheduler.schedule(std::chrono::milliseconds(admitted.unwrap().wait_ms),
            [this, pipe, request, bytes_received, done]() {
                this->writeChunk(pipe, request, bytes_received, done);
            });
        return;
    }

    const UploadAck ack{id, request.chunk_index, bytes_received};
    const bool is_last = request.is_last;
    auto written = [this, pipe, id, ack, is_last, done](RemoteStatus status) {
        pipe->busy = false;
        if (status) {
            Error err = map_remote_error(*status, pipe->path);
            if (err.code != ErrorCode::Timeout) {
                err.code = ErrorCode::ChunkError;
            }
            this->dropUpload(id);
            auto failed = this->transfers.failTransfer(id, err.message);
            if (failed.is_err()) {
                std::cerr << "[shell] upload " << id << " already gone" << std::endl;
            }
            done(with_transfer(err, id));
            return;
        }
        if (is_last && !pipe->ended) {
            pipe->ended = true;
            pipe->channel->end();
        }
        done(ack);
    };

    if (request.data.empty()) {
        written(std::nullopt);
        return;
    }
    if (!pipe->channel->write(std::move(request.data), with_timeout(this->scheduler, this->config.timeout, written))) {
        pipe->stalls++;
    }
}

void ShellBackend::completeUpload(const std::string &transfer_id, Callback<TransferCompletion> done) {
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

    std::shared_ptr<UploadPipe> pipe = it->second;
    if (!pipe->ended) {
        pipe->ended = true;
        pipe->channel->end();
    }

    auto settle = [this, pipe, transfer_id, done]() {
        this->uploads.erase(transfer_id);
        if (pipe->error || pipe->exit_code != 0) {
            Error err = pipe->error ? map_remote_error(*pipe->error, pipe->path)
                                    : map_command_error(pipe->stderr_text, pipe->exit_code, pipe->path);
            auto failed = this->transfers.failTransfer(transfer_id, err.message);
            if (failed.is_err()) {
                std::cerr << "[shell] upload " << transfer_id << " already gone" << std::endl;
            }
            done(with_transfer(err, transfer_id));
            return;
        }
        auto completion = this->transfers.completeTransfer(transfer_id);
        if (completion.is_err()) {
            done(map_transfer_error(completion.error()));
            return;
        }
        if (pipe->stalls > 0) {
            std::cout << "[shell] upload " << transfer_id << " waited on remote stdin " << pipe->stalls << " times" << std::endl;
        }
        std::cout << "[shell] upload " << transfer_id << " completed: " << completion.unwrap().bytes_transferred << " bytes" << std::endl;
        done(completion.unwrap());
    };

    if (pipe->closed) {
        settle();
        return;
    }

    // wait for `cat` to exit so its status covers the flushed file
    Scheduler *sched = &this->scheduler;
    TimerId timer = this->scheduler.schedule(this->config.timeout, [this, pipe, transfer_id, done]() {
        auto current = this->uploads.find(transfer_id);
        if (current == this->uploads.end() || current->second != pipe) {
            return;
        }
        pipe->on_closed = nullptr;
        pipe->channel->destroy();
        this->uploads.erase(transfer_id);
        auto failed = this->transfers.failTransfer(transfer_id, "Timed out waiting for remote write to finish");
        if (failed.is_err()) {
            std::cerr << "[shell] upload " << transfer_id << " already gone" << std::endl;
        }
        done(make_error(ErrorCode::Timeout, "Timed out waiting for remote write to finish", pipe->path, transfer_id));
    });
    pipe->on_closed = [sched, timer, settle]() {
        sched->cancel(timer);
        settle();
    };
}

void ShellBackend::cancelUpload(const std::string &transfer_id) {
    this->dropUpload(transfer_id);
    this->transfers.cancelTransfer(transfer_id);
    std::cout << "[shell] upload " << transfer_id << " cancelled" << std::endl;
}

void ShellBackend::dropUpload(const std::string &transfer_id) {
    auto node = this->uploads.extract(transfer_id);
    if (node.empty()) {
        return;
    }
    std::shared_ptr<UploadPipe> pipe = node.mapped();
    pipe->on_closed = nullptr;
    if (!pipe->closed) {
        pipe->channel->destroy();
    }
}

// downloads

void ShellBackend::startDownload(const DownloadStartRequest &request, Callback<DownloadReady> done) {
    OperationContext ctx{request.connection_id, request.session_id};
    this->setupOperation(ctx, request.remote_path, true, [this, request, done](Result<Setup> setup) {
        if (setup.is_err()) {
            done(with_transfer(setup.error(), request.transfer_id));
            return;
        }
        const std::string target = setup.unwrap().path;
        this->statPath(setup.unwrap().session, target, [this, request, target, done](Result<FileEntry> entry) {
            const std::string &id = request.transfer_id;
            if (entry.is_err()) {
                done(with_transfer(entry.error(), id));
                return;
            }
            const FileEntry &file = entry.unwrap();
            if (file.type != EntryType::File) {
                done(make_error(ErrorCode::InvalidRequest, "Can only download files", target, id));
                return;
            }
            if (file.size > this->config.max_file_size) {
                done(make_error(ErrorCode::FileTooLarge,
                    "File size " + std::to_string(file.size) + " exceeds maximum " + std::to_string(this->config.max_file_size), target, id));
                return;
            }

            TransferSpec spec;
            spec.transfer_id = id;
            spec.session_id = request.session_id;
            spec.connection_id = request.connection_id;
            spec.direction = TransferDirection::Download;
            spec.remote_path = target;
            spec.file_name = base_name(target);
            spec.total_bytes = file.size;
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
            std::cout << "[shell] download " << id << " started: " << target << " (" << file.size << " bytes)" << std::endl;
            done(DownloadReady{id, spec.file_name, file.size, mime_type_for(spec.file_name)});
        });
    });
}

void ShellBackend::streamDownloadChunks(const std::string &transfer_id, DownloadCallbacks callbacks) {
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
    if (!session) {
        this->transfers.cancelTransfer(transfer_id);
        callbacks.on_error(make_error(ErrorCode::NoConnection, "Shell session not found", "", transfer_id));
        return;
    }

    auto pipe = std::make_shared<DownloadPipe>(*this, *transfer, std::move(callbacks));
    this->downloads[transfer_id] = pipe;
    pipe->start(session->connection);
}

void ShellBackend::cancelDownload(const std::string &transfer_id) {
    auto node = this->downloads.extract(transfer_id);
    if (!node.empty()) {
        node.mapped()->stop();
    }
    this->transfers.cancelTransfer(transfer_id);
    std::cout << "[shell] download " << transfer_id << " cancelled" << std::endl;
}

void ShellBackend::finishDownload(const std::string &transfer_id) {
    this->downloads.erase(transfer_id);
}

size_t ShellBackend::activeDownloads() const {
    return this->downloads.size();
}

// teardown

void ShellBackend::closeSession(const std::string &connection_id) {
    for (auto it = this->downloads.begin(); it != this->downloads.end();) {
        if (it->second->connectionId() == connection_id) {
            it->second->stop();
            it = this->downloads.erase(it);
        } else {
            ++it;
        }
    }
    std::vector<std::string> stale;
    for (const auto &[id, upload] : this->uploads) {
        if (upload->connection_id == connection_id) {
            stale.push_back(id);
        }
    }
    for (const auto &id : stale) {
        this->dropUpload(id);
    }

    if (this->sessions.remove(connection_id)) {
        std::cout << "[shell] session closed for connection " << connection_id << std::endl;
    }
}

void ShellBackend::cancelSessionTransfers(const std::string &session_id) {
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
        this->dropUpload(id);
    }
    this->transfers.cancelSessionTransfers(session_id);
}

}
