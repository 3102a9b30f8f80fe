#pragma once

#include "ssh_connection.hpp"
#include "webxfer/transfer_service.hpp"
#include "webxfer/wire.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

// One client socket. Events are dispatched to the transfer service; replies may
// arrive later from the event loop, so callbacks hold a weak reference.
class Session : public std::enable_shared_from_this<Session> {
public:
    using Clock = std::chrono::steady_clock;

    Session(const int &fd, const std::string &connection_id, std::shared_ptr<SshConnection> connection,
            webxfer::TransferService &service, std::function<void(int)> close_callback);
    ~Session();

    void onMessage(const std::string &msg);
    void exit();

    // getters
    const int &getClientFD() const;
    const std::string &getConnectionId() const;
    const std::string &getSessionId() const;
    const std::shared_ptr<SshConnection> &getConnection() const;

private:
    const int client_fd;
    const std::string connection_id;
    const std::string session_id;
    std::shared_ptr<SshConnection> connection;
    webxfer::TransferService &service;
    std::function<void(int)> close_callback;
    bool closing = false;

    // session helpers
    webxfer::OperationContext context() const;
    void send(const std::string &event, const nlohmann::json &data);
    void sendError(const std::string &operation, const webxfer::Error &error);
    void logOutcome(const std::string &operation, const Clock::time_point &started, const std::string &detail, const webxfer::Error *error = nullptr) const;
    bool ensureEnabled(const std::string &operation);

    // Sends `event` with the value, or an error event for `operation`, then logs the outcome.
    template <typename T>
    webxfer::Callback<T> reply(const std::string &operation, const char *event, const Clock::time_point &started, const std::string &detail) {
        std::weak_ptr<Session> weak = this->weak_from_this();
        return [weak, operation, event, started, detail](webxfer::Result<T> result) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            if (result.is_ok()) {
                self->send(event, result.unwrap());
                self->logOutcome(operation, started, detail);
            } else {
                self->sendError(operation, result.error());
                self->logOutcome(operation, started, detail, &result.error());
            }
        };
    }

    // browsing
    void list(const nlohmann::json &data);
    void stat(const nlohmann::json &data);
    void makeDirectory(const nlohmann::json &data);
    void deletePath(const nlohmann::json &data);

    // uploading files
    void uploadStart(const nlohmann::json &data);
    void uploadChunk(const nlohmann::json &data);
    void uploadCancel(const nlohmann::json &data);

    // downloading files
    void downloadStart(const nlohmann::json &data);
    void downloadCancel(const nlohmann::json &data);
};
