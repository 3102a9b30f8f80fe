#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace webxfer {

// SFTP status numbering (draft-ietf-secsh-filexfer-02)
constexpr int SSH_FX_OK = 0;
constexpr int SSH_FX_EOF = 1;
constexpr int SSH_FX_NO_SUCH_FILE = 2;
constexpr int SSH_FX_PERMISSION_DENIED = 3;
constexpr int SSH_FX_FAILURE = 4;
constexpr int SSH_FX_FILE_ALREADY_EXISTS = 11;

struct RemoteError {
    int status = SSH_FX_FAILURE;
    std::string message;
};

// nullopt on success
using RemoteStatus = std::optional<RemoteError>;

struct RemoteAttributes {
    std::uint64_t size = 0;
    std::uint32_t mode = 0; // includes the S_IFMT type bits
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    std::int64_t atime = 0;
    std::int64_t mtime = 0;
};

struct RemoteDirEntry {
    std::string name;
    RemoteAttributes attrs;
};

enum class OpenMode {
    Read,
    WriteTruncate,
    WriteExclusive
};

using RemoteHandle = std::uint64_t;

// Remote filesystem subsystem. Every call completes exactly once through its callback.
class SftpChannel {
public:
    virtual ~SftpChannel() = default;

    virtual void readdir(const std::string &path, std::function<void(RemoteStatus, std::vector<RemoteDirEntry>)> done) = 0;
    virtual void stat(const std::string &path, std::function<void(RemoteStatus, RemoteAttributes)> done) = 0;
    virtual void mkdir(const std::string &path, const std::uint32_t &mode, std::function<void(RemoteStatus)> done) = 0;
    virtual void unlink(const std::string &path, std::function<void(RemoteStatus)> done) = 0;
    virtual void rmdir(const std::string &path, std::function<void(RemoteStatus)> done) = 0;
    virtual void realpath(const std::string &path, std::function<void(RemoteStatus, std::string)> done) = 0;

    virtual void open(const std::string &path, const OpenMode &mode, std::function<void(RemoteStatus, RemoteHandle)> done) = 0;
    // An empty buffer means end of file.
    virtual void read(const RemoteHandle &handle, const std::uint64_t &offset, const size_t &length, std::function<void(RemoteStatus, std::string)> done) = 0;
    virtual void write(const RemoteHandle &handle, const std::uint64_t &offset, std::string data, std::function<void(RemoteStatus)> done) = 0;
    virtual void close(const RemoteHandle &handle, std::function<void(RemoteStatus)> done) = 0;

    virtual void end() = 0;
};

// A remote command with its stdio streams.
class ExecChannel {
public:
    virtual ~ExecChannel() = default;

    virtual void onData(std::function<void(const std::string &)> handler) = 0;
    virtual void onStderr(std::function<void(const std::string &)> handler) = 0;
    virtual void onClose(std::function<void(int)> handler) = 0;
    virtual void onError(std::function<void(const RemoteError &)> handler) = 0;

    // Returns false when the stdin buffer is full; `done` still fires once the data is accepted.
    virtual bool write(std::string data, std::function<void(RemoteStatus)> done) = 0;
    // Sends EOF on stdin.
    virtual void end() = 0;
    // Stops delivering stdout until resumeReads(); the remote side then blocks on its window.
    virtual void pauseReads() = 0;
    virtual void resumeReads() = 0;
    virtual void destroy() = 0;
};

class RemoteConnection {
public:
    virtual ~RemoteConnection() = default;

    virtual void openSftp(std::function<void(RemoteStatus, std::shared_ptr<SftpChannel>)> done) = 0;
    virtual void exec(const std::string &command, std::function<void(RemoteStatus, std::shared_ptr<ExecChannel>)> done) = 0;
};

// connection id -> live connection, or nullptr
using ConnectionLookup = std::function<std::shared_ptr<RemoteConnection>(const std::string &)>;

}
