#include "webxfer/session_store.hpp"

namespace webxfer {

std::shared_ptr<BackendSession> SessionStore::get(const std::string &connection_id) const {
    auto it = this->sessions.find(connection_id);
    return it == this->sessions.end() ? nullptr : it->second;
}

std::shared_ptr<BackendSession> SessionStore::create(const std::string &connection_id, const std::string &session_id, std::shared_ptr<RemoteConnection> connection) {
    auto session = std::make_shared<BackendSession>();
    session->connection_id = connection_id;
    session->session_id = session_id;
    session->last_activity = std::chrono::steady_clock::now();
    session->connection = std::move(connection);
    this->sessions[connection_id] = session;
    return session;
}

void SessionStore::touch(const std::string &connection_id) {
    auto it = this->sessions.find(connection_id);
    if (it != this->sessions.end()) {
        it->second->last_activity = std::chrono::steady_clock::now();
    }
}

std::shared_ptr<BackendSession> SessionStore::remove(const std::string &connection_id) {
    auto it = this->sessions.find(connection_id);
    if (it == this->sessions.end()) {
        return nullptr;
    }
    std::shared_ptr<BackendSession> session = std::move(it->second);
    this->sessions.erase(it);
    return session;
}

std::vector<std::string> SessionStore::connectionIds() const {
    std::vector<std::string> ids;
    ids.reserve(this->sessions.size());
    for (const auto &[id, session] : this->sessions) {
        ids.push_back(id);
    }
    return ids;
}

size_t SessionStore::size() const {
    return this->sessions.size();
}

}
