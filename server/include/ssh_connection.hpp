#pragma once

#include "webxfer/config.hpp"
#include "webxfer/remote.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// A queued libssh2 call; returns false while the call would block.
using SshStep = std::function<bool()>;
// Disconnects, frees the session and closes its socket once the last channel lets go.
using SshSessionPtr = std::shared_ptr<LIBSSH2_SESSION>;

class SshSftpChannel : public webxfer::SftpChannel {
public:
    SshSftpChannel(SshSessionPtr session, LIBSSH2_SFTP *sftp);
    ~SshSftpChannel() override;

    void readdir(const std::string &path, std::function<void(webxfer::RemoteStatus, std::vector<webxfer::RemoteDirEntry>)> done) override;
    void stat(const std::string &path, std::function<void(webxfer::RemoteStatus, webxfer::RemoteAttributes)> done) override;
    void mkdir(const std::string &path, const std::uint32_t &mode, std::function<void(webxfer::RemoteStatus)> done) override;
    void unlink(const std::string &path, std::function<void(webxfer::RemoteStatus)> done) override;
    void rmdir(const std::string &path, std::function<void(webxfer::RemoteStatus)> done) override;
    void realpath(const std::string &path, std::function<void(webxfer::RemoteStatus, std::string)> done) override;

    void open(const std::string &path, const webxfer::OpenMode &mode, std::function<void(webxfer::RemoteStatus, webxfer::RemoteHandle)> done) override;
    void read(const webxfer::RemoteHandle &handle, const std::uint64_t &offset, const size_t &length, std::function<void(webxfer::RemoteStatus, std::string)> done) override;
    void write(const webxfer::RemoteHandle &handle, const std::uint64_t &offset, std::string data, std::function<void(webxfer::RemoteStatus)> done) override;
    void close(const webxfer::RemoteHandle &handle, std::function<void(webxfer::RemoteStatus)> done) override;

    void end() override;

    // Advances queued calls in order; false once the channel is shut down.
    bool poll();
    bool busy() const;

private:
    SshSessionPtr session;
    LIBSSH2_SFTP *sftp;
    std::deque<SshStep> steps;
    std::unordered_map<webxfer::RemoteHandle, LIBSSH2_SFTP_HANDLE *> handles;
    webxfer::RemoteHandle next_handle = 1;
    bool ended = false;

    bool wouldBlock() const;
    webxfer::RemoteError lastError(const std::string &what) const;
    LIBSSH2_SFTP_HANDLE *handleFor(const webxfer::RemoteHandle &handle) const;
    void simple(const std::string &what, std::function<int()> call, std::function<void(webxfer::RemoteStatus)> done);
};

class SshExecChannel : public webxfer::ExecChannel {
public:
    SshExecChannel(SshSessionPtr session, LIBSSH2_CHANNEL *channel);
    ~SshExecChannel() override;

    void onData(std::function<void(const std::string &)> handler) override;
    void onStderr(std::function<void(const std::string &)> handler) override;
    void onClose(std::function<void(int)> handler) override;
    void onError(std::function<void(const webxfer::RemoteError &)> handler) override;

    bool write(std::string data, std::function<void(webxfer::RemoteStatus)> done) override;
    void end() override;
    void pauseReads() override;
    void resumeReads() override;
    void destroy() override;

    // Pumps stdin and stdout; false once the channel is freed.
    bool poll();

private:
    struct PendingWrite {
        std::string data;
        size_t written = 0;
        std::function<void(webxfer::RemoteStatus)> done;
    };

    SshSessionPtr session;
    LIBSSH2_CHANNEL *channel;
    std::function<void(const std::string &)> data_handler;
    std::function<void(const std::string &)> stderr_handler;
    std::function<void(int)> close_handler;
    std::function<void(const webxfer::RemoteError &)> error_handler;
    std::deque<PendingWrite> writes;
    size_t queued_bytes = 0;
    bool eof_requested = false;
    bool eof_sent = false;
    bool reads_paused = false;
    bool closing = false;
    bool destroyed = false;
    bool close_sent = false;
    bool exit_read = false;
    bool finished = false;
    int exit_code = 0;

    webxfer::RemoteError lastError(const std::string &what) const;
    void pumpWrites();
    void pumpReads();
    bool finish();
    void fail(const webxfer::RemoteError &error);
    bool release();
};

// One authenticated SSH session to the configured host.
class SshConnection : public webxfer::RemoteConnection {
public:
    // Blocking connect, handshake, host key check and authentication. Throws runtime_error("ssh_connect: ...").
    static std::shared_ptr<SshConnection> connect(const webxfer::SshConfig &config);
    ~SshConnection() override;

    void openSftp(std::function<void(webxfer::RemoteStatus, std::shared_ptr<webxfer::SftpChannel>)> done) override;
    void exec(const std::string &command, std::function<void(webxfer::RemoteStatus, std::shared_ptr<webxfer::ExecChannel>)> done) override;

    void poll();
    int socket() const;
    bool wantsWrite() const;
    bool busy() const;

private:
    SshConnection(int fd, SshSessionPtr session);

    int fd;
    SshSessionPtr session;
    std::deque<SshStep> steps;
    std::vector<std::shared_ptr<SshSftpChannel>> sftp_channels;
    std::vector<std::shared_ptr<SshExecChannel>> exec_channels;

    webxfer::RemoteError lastError(const std::string &what) const;
};
