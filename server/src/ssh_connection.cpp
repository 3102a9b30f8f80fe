#include "ssh_connection.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <iostream>
#include <stdexcept>

using webxfer::RemoteAttributes;
using webxfer::RemoteDirEntry;
using webxfer::RemoteError;
using webxfer::RemoteHandle;
using webxfer::RemoteStatus;

namespace {

constexpr size_t EXEC_READ_BUFFER = 32 * 1024;
constexpr size_t EXEC_WRITE_HIGH_WATER = 256 * 1024;

RemoteAttributes to_remote(const LIBSSH2_SFTP_ATTRIBUTES &attrs) {
    RemoteAttributes out;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) out.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) out.mode = static_cast<std::uint32_t>(attrs.permissions);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        out.uid = static_cast<std::uint32_t>(attrs.uid);
        out.gid = static_cast<std::uint32_t>(attrs.gid);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        out.atime = static_cast<std::int64_t>(attrs.atime);
        out.mtime = static_cast<std::int64_t>(attrs.mtime);
    }
    return out;
}

std::string session_message(LIBSSH2_SESSION *session) {
    char *msg = nullptr;
    libssh2_session_last_error(session, &msg, nullptr, 0);
    return msg ? std::string(msg) : std::string("unknown error");
}

int tcp_connect(const std::string &host, const std::uint16_t &port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (gai != 0) {
        throw std::runtime_error("ssh_connect: getaddrinfo failed for " + host + ": " + gai_strerror(gai));
    }

    int fd = -1;
    for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;
        int enable = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &enable, sizeof(enable));
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable));
        if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    if (fd < 0) {
        throw std::runtime_error("ssh_connect: Could not connect to " + host + ":" + std::to_string(port));
    }
    return fd;
}

void check_known_host(LIBSSH2_SESSION *session, const webxfer::SshConfig &config) {
    LIBSSH2_KNOWNHOSTS *hosts = libssh2_knownhost_init(session);
    if (!hosts) {
        throw std::runtime_error("ssh_hostkey: Failed to initialize known hosts");
    }
    if (libssh2_knownhost_readfile(hosts, config.known_hosts.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        libssh2_knownhost_free(hosts);
        throw std::runtime_error("ssh_hostkey: Cannot read " + config.known_hosts);
    }

    size_t key_len = 0;
    int key_type = 0;
    const char *key = libssh2_session_hostkey(session, &key_len, &key_type);
    if (!key || key_len == 0) {
        libssh2_knownhost_free(hosts);
        throw std::runtime_error("ssh_hostkey: Server sent no host key");
    }

    libssh2_knownhost *match = nullptr;
    const int mask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW;
    int check = libssh2_knownhost_checkp(hosts, config.host.c_str(), config.port, key, key_len, mask, &match);
    libssh2_knownhost_free(hosts);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        throw std::runtime_error("ssh_hostkey: Host key for " + config.host + " does not match known_hosts");
    }
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        throw std::runtime_error("ssh_hostkey: Host " + config.host + " is not in " + config.known_hosts);
    }
}

}

// sftp channel

SshSftpChannel::SshSftpChannel(SshSessionPtr session, LIBSSH2_SFTP *sftp) : session(std::move(session)), sftp(sftp) {}

SshSftpChannel::~SshSftpChannel() {
    if (!this->sftp) {
        return;
    }
    libssh2_session_set_blocking(this->session.get(), 1);
    for (auto &[id, handle] : this->handles) {
        if (libssh2_sftp_close_handle(handle) < 0) {
            std::cerr << "[ssh] failed to close SFTP handle " << id << std::endl;
        }
    }
    if (libssh2_sftp_shutdown(this->sftp) < 0) {
        std::cerr << "[ssh] SFTP shutdown failed: " << session_message(this->session.get()) << std::endl;
    }
    libssh2_session_set_blocking(this->session.get(), 0);
}

bool SshSftpChannel::wouldBlock() const {
    return libssh2_session_last_errno(this->session.get()) == LIBSSH2_ERROR_EAGAIN;
}

RemoteError SshSftpChannel::lastError(const std::string &what) const {
    int status = webxfer::SSH_FX_FAILURE;
    if (libssh2_session_last_errno(this->session.get()) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        status = static_cast<int>(libssh2_sftp_last_error(this->sftp));
    }
    return RemoteError{status, what + ": " + session_message(this->session.get())};
}

LIBSSH2_SFTP_HANDLE *SshSftpChannel::handleFor(const RemoteHandle &handle) const {
    auto it = this->handles.find(handle);
    return it == this->handles.end() ? nullptr : it->second;
}

bool SshSftpChannel::poll() {
    while (!this->steps.empty()) {
        SshStep step = std::move(this->steps.front());
        this->steps.pop_front();
        if (!step()) {
            this->steps.push_front(std::move(step));
            break;
        }
    }
    return this->sftp != nullptr || !this->steps.empty();
}

bool SshSftpChannel::busy() const {
    return !this->steps.empty();
}

void SshSftpChannel::simple(const std::string &what, std::function<int()> call, std::function<void(RemoteStatus)> done) {
    if (this->ended) {
        done(RemoteError{webxfer::SSH_FX_FAILURE, what + ": SFTP channel closed"});
        return;
    }
    this->steps.push_back([this, what, call, done]() {
        int rc = call();
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        if (rc < 0) {
            done(this->lastError(what));
        } else {
            done(std::nullopt);
        }
        return true;
    });
}

void SshSftpChannel::readdir(const std::string &path, std::function<void(RemoteStatus, std::vector<RemoteDirEntry>)> done) {
    if (this->ended) {
        done(RemoteError{webxfer::SSH_FX_FAILURE, "readdir: SFTP channel closed"}, {});
        return;
    }
    struct Listing {
        LIBSSH2_SFTP_HANDLE *dir = nullptr;
        std::vector<RemoteDirEntry> entries;
        std::optional<RemoteError> error;
        bool closing = false;
    };
    auto state = std::make_shared<Listing>();
    this->steps.push_back([this, path, state, done]() {
        if (!state->dir) {
            state->dir = libssh2_sftp_open_ex(this->sftp, path.c_str(), static_cast<unsigned int>(path.size()), 0, 0, LIBSSH2_SFTP_OPENDIR);
            if (!state->dir) {
                if (this->wouldBlock()) {
                    return false;
                }
                done(this->lastError("opendir " + path), {});
                return true;
            }
        }
        while (!state->closing) {
            char name[512];
            char longentry[1024];
            LIBSSH2_SFTP_ATTRIBUTES attrs{};
            int rc = libssh2_sftp_readdir_ex(state->dir, name, sizeof(name), longentry, sizeof(longentry), &attrs);
            if (rc == LIBSSH2_ERROR_EAGAIN) {
                return false;
            }
            if (rc > 0) {
                state->entries.push_back(RemoteDirEntry{std::string(name, static_cast<size_t>(rc)), to_remote(attrs)});
                continue;
            }
            if (rc < 0) {
                state->error = this->lastError("readdir " + path);
            }
            state->closing = true;
        }
        if (libssh2_sftp_close_handle(state->dir) == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        if (state->error) {
            done(*state->error, {});
        } else {
            done(std::nullopt, std::move(state->entries));
        }
        return true;
    });
}

void SshSftpChannel::stat(const std::string &path, std::function<void(RemoteStatus, RemoteAttributes)> done) {
    if (this->ended) {
        done(RemoteError{webxfer::SSH_FX_FAILURE, "stat: SFTP channel closed"}, {});
        return;
    }
    this->steps.push_back([this, path, done]() {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        int rc = libssh2_sftp_stat_ex(this->sftp, path.c_str(), static_cast<unsigned int>(path.size()), LIBSSH2_SFTP_STAT, &attrs);
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        if (rc < 0) {
            done(this->lastError("stat " + path), {});
        } else {
            done(std::nullopt, to_remote(attrs));
        }
        return true;
    });
}

void SshSftpChannel::mkdir(const std::string &path, const std::uint32_t &mode, std::function<void(RemoteStatus)> done) {
    this->simple("mkdir " + path, [this, path, mode]() {
        return libssh2_sftp_mkdir_ex(this->sftp, path.c_str(), static_cast<unsigned int>(path.size()), static_cast<long>(mode));
    }, std::move(done));
}

void SshSftpChannel::unlink(const std::string &path, std::function<void(RemoteStatus)> done) {
    this->simple("unlink " + path, [this, path]() {
        return libssh2_sftp_unlink_ex(this->sftp, path.c_str(), static_cast<unsigned int>(path.size()));
    }, std::move(done));
}

void SshSftpChannel::rmdir(const std::string &path, std::function<void(RemoteStatus)> done) {
    this->simple("rmdir " + path, [this, path]() {
        return libssh2_sftp_rmdir_ex(this->sftp, path.c_str(), static_cast<unsigned int>(path.size()));
    }, std::move(done));
}

void SshSftpChannel::realpath(const std::string &path, std::function<void(RemoteStatus, std::string)> done) {
    if (this->ended) {
        done(RemoteError{webxfer::SSH_FX_FAILURE, "realpath: SFTP channel closed"}, "");
        return;
    }
    this->steps.push_back([this, path, done]() {
        char target[4096];
        int rc = libssh2_sftp_symlink_ex(this->sftp, path.c_str(), static_cast<unsigned int>(path.size()), target, sizeof(target), LIBSSH2_SFTP_REALPATH);
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        if (rc < 0) {
            done(this->lastError("realpath " + path), "");
        } else {
            done(std::nullopt, std::string(target, static_cast<size_t>(rc)));
        }
        return true;
    });
}

void SshSftpChannel::open(const std::string &path, const webxfer::OpenMode &mode, std::function<void(RemoteStatus, RemoteHandle)> done) {
    if (this->ended) {
        done(RemoteError{webxfer::SSH_FX_FAILURE, "open: SFTP channel closed"}, 0);
        return;
    }
    unsigned long flags = LIBSSH2_FXF_READ;
    if (mode == webxfer::OpenMode::WriteTruncate) {
        flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
    } else if (mode == webxfer::OpenMode::WriteExclusive) {
        flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_EXCL;
    }
    const long file_mode = LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH;
    this->steps.push_back([this, path, flags, file_mode, done]() {
        LIBSSH2_SFTP_HANDLE *handle = libssh2_sftp_open_ex(this->sftp, path.c_str(), static_cast<unsigned int>(path.size()), flags, file_mode, LIBSSH2_SFTP_OPENFILE);
        if (!handle) {
            if (this->wouldBlock()) {
                return false;
            }
            done(this->lastError("open " + path), 0);
            return true;
        }
        RemoteHandle id = this->next_handle++;
        this->handles[id] = handle;
        done(std::nullopt, id);
        return true;
    });
}

void SshSftpChannel::read(const RemoteHandle &handle, const std::uint64_t &offset, const size_t &length, std::function<void(RemoteStatus, std::string)> done) {
    if (this->ended) {
        done(RemoteError{webxfer::SSH_FX_FAILURE, "read: SFTP channel closed"}, "");
        return;
    }
    auto seeked = std::make_shared<bool>(false);
    this->steps.push_back([this, handle, offset, length, seeked, done]() {
        LIBSSH2_SFTP_HANDLE *h = this->handleFor(handle);
        if (!h) {
            done(RemoteError{webxfer::SSH_FX_FAILURE, "read: invalid handle"}, "");
            return true;
        }
        if (!*seeked) {
            libssh2_sftp_seek64(h, offset);
            *seeked = true;
        }
        std::string buffer(length, '\0');
        ssize_t rc = libssh2_sftp_read(h, buffer.data(), length);
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        if (rc < 0) {
            done(this->lastError("read"), "");
            return true;
        }
        buffer.resize(static_cast<size_t>(rc));
        done(std::nullopt, std::move(buffer));
        return true;
    });
}

void SshSftpChannel::write(const RemoteHandle &handle, const std::uint64_t &offset, std::string data, std::function<void(RemoteStatus)> done) {
    if (this->ended) {
        done(RemoteError{webxfer::SSH_FX_FAILURE, "write: SFTP channel closed"});
        return;
    }
    struct Pending {
        std::string data;
        size_t written = 0;
        bool seeked = false;
    };
    auto state = std::make_shared<Pending>();
    state->data = std::move(data);
    this->steps.push_back([this, handle, offset, state, done]() {
        LIBSSH2_SFTP_HANDLE *h = this->handleFor(handle);
        if (!h) {
            done(RemoteError{webxfer::SSH_FX_FAILURE, "write: invalid handle"});
            return true;
        }
        if (!state->seeked) {
            libssh2_sftp_seek64(h, offset);
            state->seeked = true;
        }
        while (state->written < state->data.size()) {
            ssize_t rc = libssh2_sftp_write(h, state->data.data() + state->written, state->data.size() - state->written);
            if (rc == LIBSSH2_ERROR_EAGAIN) {
                return false;
            }
            if (rc < 0) {
                done(this->lastError("write"));
                return true;
            }
            state->written += static_cast<size_t>(rc);
        }
        done(std::nullopt);
        return true;
    });
}

void SshSftpChannel::close(const RemoteHandle &handle, std::function<void(RemoteStatus)> done) {
    if (this->ended) {
        done(RemoteError{webxfer::SSH_FX_FAILURE, "close: SFTP channel closed"});
        return;
    }
    this->steps.push_back([this, handle, done]() {
        LIBSSH2_SFTP_HANDLE *h = this->handleFor(handle);
        if (!h) {
            done(RemoteError{webxfer::SSH_FX_FAILURE, "close: invalid handle"});
            return true;
        }
        int rc = libssh2_sftp_close_handle(h);
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        this->handles.erase(handle);
        if (rc < 0) {
            done(this->lastError("close"));
        } else {
            done(std::nullopt);
        }
        return true;
    });
}

void SshSftpChannel::end() {
    if (this->ended) {
        return;
    }
    this->ended = true;
    this->steps.push_back([this]() {
        for (auto it = this->handles.begin(); it != this->handles.end();) {
            if (libssh2_sftp_close_handle(it->second) == LIBSSH2_ERROR_EAGAIN) {
                return false;
            }
            it = this->handles.erase(it);
        }
        if (libssh2_sftp_shutdown(this->sftp) == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        this->sftp = nullptr;
        return true;
    });
}

// exec channel

SshExecChannel::SshExecChannel(SshSessionPtr session, LIBSSH2_CHANNEL *channel) : session(std::move(session)), channel(channel) {}

SshExecChannel::~SshExecChannel() {
    if (!this->channel) {
        return;
    }
    libssh2_session_set_blocking(this->session.get(), 1);
    if (libssh2_channel_free(this->channel) < 0) {
        std::cerr << "[ssh] failed to free exec channel: " << session_message(this->session.get()) << std::endl;
    }
    libssh2_session_set_blocking(this->session.get(), 0);
}

RemoteError SshExecChannel::lastError(const std::string &what) const {
    return RemoteError{webxfer::SSH_FX_FAILURE, what + ": " + session_message(this->session.get())};
}

void SshExecChannel::onData(std::function<void(const std::string &)> handler) {
    this->data_handler = std::move(handler);
}

void SshExecChannel::onStderr(std::function<void(const std::string &)> handler) {
    this->stderr_handler = std::move(handler);
}

void SshExecChannel::onClose(std::function<void(int)> handler) {
    this->close_handler = std::move(handler);
}

void SshExecChannel::onError(std::function<void(const RemoteError &)> handler) {
    this->error_handler = std::move(handler);
}

bool SshExecChannel::write(std::string data, std::function<void(RemoteStatus)> done) {
    if (this->destroyed || this->finished || this->eof_requested) {
        done(RemoteError{webxfer::SSH_FX_FAILURE, "write: channel is closed for input"});
        return true;
    }
    this->queued_bytes += data.size();
    this->writes.push_back(PendingWrite{std::move(data), 0, std::move(done)});
    return this->queued_bytes <= EXEC_WRITE_HIGH_WATER;
}

void SshExecChannel::end() {
    this->eof_requested = true;
}

void SshExecChannel::pauseReads() {
    this->reads_paused = true;
}

void SshExecChannel::resumeReads() {
    this->reads_paused = false;
}

void SshExecChannel::destroy() {
    if (this->destroyed) {
        return;
    }
    this->destroyed = true;
    this->data_handler = nullptr;
    this->stderr_handler = nullptr;
    this->close_handler = nullptr;
    this->error_handler = nullptr;

    std::deque<PendingWrite> dropped;
    dropped.swap(this->writes);
    this->queued_bytes = 0;
    for (auto &pending : dropped) {
        pending.done(RemoteError{webxfer::SSH_FX_FAILURE, "write: channel destroyed"});
    }
}

void SshExecChannel::fail(const RemoteError &error) {
    auto handler = std::move(this->error_handler);
    this->destroy();
    if (handler) {
        handler(error);
    }
}

void SshExecChannel::pumpWrites() {
    while (!this->destroyed && !this->writes.empty()) {
        PendingWrite &front = this->writes.front();
        ssize_t rc = libssh2_channel_write(this->channel, front.data.data() + front.written, front.data.size() - front.written);
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return;
        }
        if (rc < 0) {
            this->fail(this->lastError("channel write"));
            return;
        }
        front.written += static_cast<size_t>(rc);
        if (front.written < front.data.size()) {
            continue;
        }
        auto done = std::move(front.done);
        this->queued_bytes -= front.data.size();
        this->writes.pop_front();
        done(std::nullopt);
    }
    if (!this->destroyed && this->writes.empty() && this->eof_requested && !this->eof_sent) {
        int rc = libssh2_channel_send_eof(this->channel);
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return;
        }
        if (rc < 0) {
            this->fail(this->lastError("send eof"));
            return;
        }
        this->eof_sent = true;
    }
}

void SshExecChannel::pumpReads() {
    char buffer[EXEC_READ_BUFFER];
    // unread stdout stays in libssh2 and the channel window stops the remote writer
    while (!this->destroyed && !this->reads_paused) {
        ssize_t rc = libssh2_channel_read(this->channel, buffer, sizeof(buffer));
        if (rc == LIBSSH2_ERROR_EAGAIN || rc == 0) {
            break;
        }
        if (rc < 0) {
            this->fail(this->lastError("channel read"));
            return;
        }
        if (auto handler = this->data_handler) {
            handler(std::string(buffer, static_cast<size_t>(rc)));
        }
    }
    while (!this->destroyed) {
        ssize_t rc = libssh2_channel_read_stderr(this->channel, buffer, sizeof(buffer));
        if (rc == LIBSSH2_ERROR_EAGAIN || rc == 0) {
            break;
        }
        if (rc < 0) {
            this->fail(this->lastError("channel read"));
            return;
        }
        if (auto handler = this->stderr_handler) {
            handler(std::string(buffer, static_cast<size_t>(rc)));
        }
    }
}

bool SshExecChannel::release() {
    if (!this->channel) {
        return true;
    }
    if (libssh2_channel_free(this->channel) == LIBSSH2_ERROR_EAGAIN) {
        return false;
    }
    this->channel = nullptr;
    return true;
}

bool SshExecChannel::finish() {
    if (!this->close_sent) {
        int rc = libssh2_channel_close(this->channel);
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        this->close_sent = true;
    }
    if (!this->exit_read && !this->destroyed) {
        if (libssh2_channel_wait_closed(this->channel) == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        this->exit_code = libssh2_channel_get_exit_status(this->channel);
        this->exit_read = true;
    }
    if (!this->release()) {
        return false;
    }
    this->finished = true;
    if (!this->destroyed && this->close_handler) {
        auto handler = std::move(this->close_handler);
        handler(this->exit_code);
    }
    return true;
}

bool SshExecChannel::poll() {
    if (this->finished) {
        return false;
    }
    if (!this->destroyed) {
        this->pumpWrites();
        this->pumpReads();
        if (!this->destroyed && !this->closing && libssh2_channel_eof(this->channel)) {
            this->closing = true;
        }
    }
    if (this->destroyed || this->closing) {
        return !this->finish();
    }
    return true;
}

// connection

std::shared_ptr<SshConnection> SshConnection::connect(const webxfer::SshConfig &config) {
    int fd = tcp_connect(config.host, config.port);

    LIBSSH2_SESSION *raw = libssh2_session_init();
    if (!raw) {
        ::close(fd);
        throw std::runtime_error("ssh_connect: libssh2_session_init failed");
    }
    SshSessionPtr session(raw, [fd](LIBSSH2_SESSION *s) {
        libssh2_session_set_blocking(s, 1);
        libssh2_session_disconnect(s, "Normal Shutdown");
        libssh2_session_free(s);
        ::close(fd);
    });

    if (libssh2_session_handshake(session.get(), fd) != 0) {
        throw std::runtime_error("ssh_connect: SSH handshake failed: " + session_message(session.get()));
    }
    if (!config.known_hosts.empty()) {
        check_known_host(session.get(), config);
    }

    int rc = 0;
    if (!config.private_key.empty()) {
        rc = libssh2_userauth_publickey_fromfile_ex(session.get(), config.username.c_str(), static_cast<unsigned int>(config.username.size()),
                                                    nullptr, config.private_key.c_str(),
                                                    config.passphrase.empty() ? nullptr : config.passphrase.c_str());
    } else {
        rc = libssh2_userauth_password_ex(session.get(), config.username.c_str(), static_cast<unsigned int>(config.username.size()),
                                          config.password.c_str(), static_cast<unsigned int>(config.password.size()), nullptr);
    }
    if (rc != 0) {
        throw std::runtime_error("ssh_auth: Authentication failed for user " + config.username);
    }

    libssh2_keepalive_config(session.get(), 1, 30);
    libssh2_session_set_blocking(session.get(), 0);
    std::cout << "[ssh] connected to " << config.username << "@" << config.host << ":" << config.port << std::endl;
    return std::shared_ptr<SshConnection>(new SshConnection(fd, std::move(session)));
}

SshConnection::SshConnection(int fd, SshSessionPtr session) : fd(fd), session(std::move(session)) {}

SshConnection::~SshConnection() {
    this->steps.clear();
    this->exec_channels.clear();
    this->sftp_channels.clear();
}

RemoteError SshConnection::lastError(const std::string &what) const {
    return RemoteError{webxfer::SSH_FX_FAILURE, what + ": " + session_message(this->session.get())};
}

void SshConnection::openSftp(std::function<void(RemoteStatus, std::shared_ptr<webxfer::SftpChannel>)> done) {
    this->steps.push_back([this, done]() {
        LIBSSH2_SFTP *sftp = libssh2_sftp_init(this->session.get());
        if (!sftp) {
            if (libssh2_session_last_errno(this->session.get()) == LIBSSH2_ERROR_EAGAIN) {
                return false;
            }
            done(this->lastError("sftp init"), nullptr);
            return true;
        }
        auto channel = std::make_shared<SshSftpChannel>(this->session, sftp);
        this->sftp_channels.push_back(channel);
        done(std::nullopt, channel);
        return true;
    });
}

void SshConnection::exec(const std::string &command, std::function<void(RemoteStatus, std::shared_ptr<webxfer::ExecChannel>)> done) {
    auto opened = std::make_shared<LIBSSH2_CHANNEL *>(nullptr);
    this->steps.push_back([this, command, opened, done]() {
        if (!*opened) {
            *opened = libssh2_channel_open_session(this->session.get());
            if (!*opened) {
                if (libssh2_session_last_errno(this->session.get()) == LIBSSH2_ERROR_EAGAIN) {
                    return false;
                }
                done(this->lastError("channel open"), nullptr);
                return true;
            }
        }
        int rc = libssh2_channel_exec(*opened, command.c_str());
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            return false;
        }
        // the wrapper owns the channel from here, including on failure
        auto channel = std::make_shared<SshExecChannel>(this->session, *opened);
        if (rc < 0) {
            done(this->lastError("exec"), nullptr);
            return true;
        }
        this->exec_channels.push_back(channel);
        done(std::nullopt, channel);
        return true;
    });
}

void SshConnection::poll() {
    while (!this->steps.empty()) {
        SshStep step = std::move(this->steps.front());
        this->steps.pop_front();
        if (!step()) {
            this->steps.push_front(std::move(step));
            break;
        }
    }

    auto sftp_channels = this->sftp_channels;
    for (auto &channel : sftp_channels) {
        if (!channel->poll()) {
            std::erase(this->sftp_channels, channel);
        }
    }
    auto exec_channels = this->exec_channels;
    for (auto &channel : exec_channels) {
        if (!channel->poll()) {
            std::erase(this->exec_channels, channel);
        }
    }
}

int SshConnection::socket() const {
    return this->fd;
}

bool SshConnection::wantsWrite() const {
    return (libssh2_session_block_directions(this->session.get()) & LIBSSH2_SESSION_BLOCK_OUTBOUND) != 0;
}

bool SshConnection::busy() const {
    if (!this->steps.empty() || !this->exec_channels.empty()) {
        return true;
    }
    for (const auto &channel : this->sftp_channels) {
        if (channel->busy()) {
            return true;
        }
    }
    return false;
}
