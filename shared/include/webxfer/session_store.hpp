#pragma once

#include "remote.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace webxfer {

// Per-connection state a backend keeps between operations.
struct BackendSession {
    std::string connection_id;
    std::string session_id;
    std::optional<std::string> home_dir;
    std::chrono::steady_clock::time_point last_activity;
    std::shared_ptr<RemoteConnection> connection;
    std::shared_ptr<SftpChannel> sftp; // null for the shell backend
};

class SessionStore {
public:
    std::shared_ptr<BackendSession> get(const std::string &connection_id) const;
    std::shared_ptr<BackendSession> create(const std::string &connection_id, const std::string &session_id, std::shared_ptr<RemoteConnection> connection);
    void touch(const std::string &connection_id);
    // Removes the session and hands it back so the caller can release its channels.
    std::shared_ptr<BackendSession> remove(const std::string &connection_id);
    std::vector<std::string> connectionIds() const;
    size_t size() const;

private:
    std::unordered_map<std::string, std::shared_ptr<BackendSession>> sessions;
};

}
