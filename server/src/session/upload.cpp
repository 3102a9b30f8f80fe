#include "session.hpp"

#include <iostream>

using namespace webxfer;

void Session::uploadStart(const nlohmann::json &data) {
    auto started = Clock::now();
    if (!this->ensureEnabled("upload")) {
        return;
    }
    auto parsed = parse_upload_start_message(data);
    if (parsed.is_err()) {
        this->sendError("upload", parsed.error());
        this->logOutcome("upload_start", started, "invalid request", &parsed.error());
        return;
    }
    const UploadStartMessage &message = parsed.unwrap();

    UploadStartRequest request;
    request.transfer_id = message.transfer_id;
    request.session_id = this->session_id;
    request.connection_id = this->connection_id;
    request.remote_path = message.remote_path;
    request.file_name = message.file_name;
    request.file_size = message.file_size;
    request.overwrite = message.overwrite;

    std::string detail = "path=" + message.remote_path + " size=" + std::to_string(message.file_size);
    this->service.startUpload(std::move(request), this->reply<UploadReady>("upload", events::UPLOAD_READY, started, detail));
}

void Session::uploadChunk(const nlohmann::json &data) {
    auto started = Clock::now();
    if (!this->ensureEnabled("upload")) {
        return;
    }
    auto parsed = parse_upload_chunk_message(data, this->service.config().chunk_size);
    if (parsed.is_err()) {
        this->sendError("upload", parsed.error());
        this->logOutcome("upload_chunk", started, "invalid request", &parsed.error());
        return;
    }
    UploadChunkRequest request = std::move(parsed.unwrap());
    std::string detail = "transfer=" + request.transfer_id + " chunk=" + std::to_string(request.chunk_index);
    std::string transfer_id = request.transfer_id;

    std::weak_ptr<Session> weak = this->weak_from_this();
    this->service.processUploadChunk(
        this->session_id, std::move(request),
        this->reply<UploadAck>("upload", events::UPLOAD_ACK, started, detail),
        [weak, started, transfer_id](Result<TransferCompletion> result) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            if (result.is_ok()) {
                self->send(events::COMPLETE, result.unwrap());
                self->logOutcome("upload_complete", started, "transfer=" + transfer_id);
            } else {
                self->sendError("upload", result.error());
                self->logOutcome("upload_complete", started, "transfer=" + transfer_id, &result.error());
            }
        });
}

void Session::uploadCancel(const nlohmann::json &data) {
    auto parsed = parse_cancel_message(data);
    if (parsed.is_err()) {
        this->sendError("upload", parsed.error());
        return;
    }
    // foreign and unknown ids are dropped by the service without a reply
    this->service.cancelUpload(this->session_id, parsed.unwrap());
    std::cout << "[server] fd=" << this->client_fd << " upload_cancel transfer=" << parsed.unwrap() << std::endl;
}
