#include "session.hpp"
#include "webxfer/helpers.hpp"
#include "webxfer/wire.hpp"

#include <iostream>

using namespace webxfer;

// constructor
Session::Session(const int &fd, const std::string &connection_id, std::shared_ptr<SshConnection> connection,
                 TransferService &service, std::function<void(int)> close_callback)
    : client_fd(fd),
      connection_id(connection_id),
      session_id("s-" + generate_transfer_id()),
      connection(std::move(connection)),
      service(service),
      close_callback(std::move(close_callback)) {}

// destructor
Session::~Session() {
    this->service.disconnect(this->connection_id, this->session_id);
}

// main message handler
void Session::onMessage(const std::string &msg) {
    try {
        nlohmann::json message = nlohmann::json::parse(msg);
        if (!message.is_object() || !message.contains("event") || !message.at("event").is_string()) {
            throw std::runtime_error("bad_message: Message must be an object with an event name");
        }
        const std::string event = message.at("event").get<std::string>();
        const nlohmann::json data = message.value("data", nlohmann::json::object());

        // browsing
        if (event == events::LIST) {
            this->list(data);
        } else if (event == events::STAT) {
            this->stat(data);
        } else if (event == events::MKDIR) {
            this->makeDirectory(data);
        } else if (event == events::DELETE) {
            this->deletePath(data);

        // transfers
        } else if (event == events::UPLOAD_START) {
            this->uploadStart(data);
        } else if (event == events::UPLOAD_CHUNK) {
            this->uploadChunk(data);
        } else if (event == events::UPLOAD_CANCEL) {
            this->uploadCancel(data);
        } else if (event == events::DOWNLOAD_START) {
            this->downloadStart(data);
        } else if (event == events::DOWNLOAD_CANCEL) {
            this->downloadCancel(data);
        } else {
            throw std::runtime_error("unknown_event: Unknown event: " + event);
        }
    } catch (const nlohmann::json::exception &e) {
        this->sendError("message", make_error(ErrorCode::InvalidRequest, "Malformed message"));
        std::cerr << "[server] malformed message from client fd=" << this->client_fd << ": " << e.what() << std::endl;
    } catch (const std::exception &e) {
        this->sendError("message", make_error(ErrorCode::InvalidRequest, e.what()));
        std::cerr << "[server] error processing message from client fd=" << this->client_fd << ": " << e.what() << std::endl;
    }
}

void Session::exit() {
    if (this->closing) {
        return;
    }
    this->closing = true;
    this->close_callback(this->client_fd);
}

// session helpers

OperationContext Session::context() const {
    return OperationContext{this->connection_id, this->session_id};
}

void Session::send(const std::string &event, const nlohmann::json &data) {
    if (this->closing) {
        return;
    }
    try {
        send_msg(this->client_fd, make_event(event, data));
    } catch (const std::exception &e) {
        std::cerr << "[server] failed to send " << event << " to client fd=" << this->client_fd << ": " << e.what() << std::endl;
        this->exit();
    }
}

void Session::sendError(const std::string &operation, const Error &error) {
    this->send(events::ERROR, error_payload(operation, error));
}

void Session::logOutcome(const std::string &operation, const Clock::time_point &started, const std::string &detail, const Error *error) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
    if (error) {
        std::cerr << "[server] fd=" << this->client_fd << " " << operation << " failed after " << elapsed << " ms: "
                  << error_code_name(error->code) << " " << error->message << " (" << detail << ")" << std::endl;
    } else {
        std::cout << "[server] fd=" << this->client_fd << " " << operation << " ok in " << elapsed << " ms (" << detail << ")" << std::endl;
    }
}

bool Session::ensureEnabled(const std::string &operation) {
    if (this->service.isEnabled()) {
        return true;
    }
    this->sendError(operation, make_error(ErrorCode::NotEnabled, "SFTP feature is disabled"));
    return false;
}

// getters

const int &Session::getClientFD() const {
    return this->client_fd;
}

const std::string &Session::getConnectionId() const {
    return this->connection_id;
}

const std::string &Session::getSessionId() const {
    return this->session_id;
}

const std::shared_ptr<SshConnection> &Session::getConnection() const {
    return this->connection;
}
