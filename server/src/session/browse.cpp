#include "session.hpp"

using namespace webxfer;

void Session::list(const nlohmann::json &data) {
    auto started = Clock::now();
    if (!this->ensureEnabled("list")) {
        return;
    }
    auto parsed = parse_list_message(data);
    if (parsed.is_err()) {
        this->sendError("list", parsed.error());
        this->logOutcome("list", started, "invalid request", &parsed.error());
        return;
    }
    const ListMessage &request = parsed.unwrap();
    this->service.listDirectory(this->context(), request.path, request.show_hidden,
                                this->reply<DirectoryListing>("list", events::DIRECTORY, started, "path=" + request.path));
}

void Session::stat(const nlohmann::json &data) {
    auto started = Clock::now();
    if (!this->ensureEnabled("stat")) {
        return;
    }
    auto parsed = parse_stat_message(data);
    if (parsed.is_err()) {
        this->sendError("stat", parsed.error());
        this->logOutcome("stat", started, "invalid request", &parsed.error());
        return;
    }
    const std::string &path = parsed.unwrap();
    this->service.stat(this->context(), path, this->reply<StatResult>("stat", events::STAT_RESULT, started, "path=" + path));
}

void Session::makeDirectory(const nlohmann::json &data) {
    auto started = Clock::now();
    if (!this->ensureEnabled("mkdir")) {
        return;
    }
    auto parsed = parse_mkdir_message(data);
    if (parsed.is_err()) {
        this->sendError("mkdir", parsed.error());
        this->logOutcome("mkdir", started, "invalid request", &parsed.error());
        return;
    }
    const MkdirMessage &request = parsed.unwrap();
    this->service.mkdir(this->context(), request.path, request.mode,
                        this->reply<OperationResult>("mkdir", events::OPERATION_RESULT, started, "path=" + request.path));
}

void Session::deletePath(const nlohmann::json &data) {
    auto started = Clock::now();
    if (!this->ensureEnabled("delete")) {
        return;
    }
    auto parsed = parse_delete_message(data);
    if (parsed.is_err()) {
        this->sendError("delete", parsed.error());
        this->logOutcome("delete", started, "invalid request", &parsed.error());
        return;
    }
    const DeleteMessage &request = parsed.unwrap();
    std::string detail = "path=" + request.path + (request.recursive ? " recursive" : "");
    this->service.deletePath(this->context(), request.path, request.recursive,
                             this->reply<OperationResult>("delete", events::OPERATION_RESULT, started, detail));
}
