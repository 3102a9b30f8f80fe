#include "session.hpp"

#include <iostream>

using namespace webxfer;

void Session::downloadStart(const nlohmann::json &data) {
    auto started = Clock::now();
    if (!this->ensureEnabled("download")) {
        return;
    }
    auto parsed = parse_download_start_message(data);
    if (parsed.is_err()) {
        this->sendError("download", parsed.error());
        this->logOutcome("download_start", started, "invalid request", &parsed.error());
        return;
    }
    const DownloadStartMessage &message = parsed.unwrap();

    DownloadStartRequest request;
    request.transfer_id = message.transfer_id;
    request.session_id = this->session_id;
    request.connection_id = this->connection_id;
    request.remote_path = message.remote_path;

    std::weak_ptr<Session> weak = this->weak_from_this();
    std::string path = message.remote_path;

    DownloadCallbacks stream;
    stream.on_chunk = [weak](const DownloadChunk &chunk) {
        if (auto self = weak.lock()) {
            self->send(events::DOWNLOAD_CHUNK, chunk);
        }
    };
    stream.on_progress = [weak](const TransferProgress &progress) {
        if (auto self = weak.lock()) {
            self->send(events::PROGRESS, progress);
        }
    };
    stream.on_complete = [weak, started, path](const TransferCompletion &completion) {
        if (auto self = weak.lock()) {
            self->send(events::COMPLETE, completion);
            self->logOutcome("download_complete", started, "path=" + path + " bytes=" + std::to_string(completion.bytes_transferred));
        }
    };
    stream.on_error = [weak, started, path](const Error &error) {
        if (auto self = weak.lock()) {
            self->sendError("download", error);
            self->logOutcome("download_complete", started, "path=" + path, &error);
        }
    };

    this->service.startDownload(std::move(request),
                                this->reply<DownloadReady>("download", events::DOWNLOAD_READY, started, "path=" + path),
                                std::move(stream));
}

void Session::downloadCancel(const nlohmann::json &data) {
    auto parsed = parse_cancel_message(data);
    if (parsed.is_err()) {
        this->sendError("download", parsed.error());
        return;
    }
    this->service.cancelDownload(this->session_id, parsed.unwrap());
    std::cout << "[server] fd=" << this->client_fd << " download_cancel transfer=" << parsed.unwrap() << std::endl;
}
