#include "webxfer/transfer_manager.hpp"

#include <iostream>

namespace webxfer {

const char *direction_name(const TransferDirection &direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

const char *status_name(const TransferStatus &status) {
    switch (status) {
        case TransferStatus::Pending:   return "pending";
        case TransferStatus::Active:    return "active";
        case TransferStatus::Paused:    return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Cancelled: return "cancelled";
        case TransferStatus::Error:     return "error";
    }
    return "error";
}

TransferManager::TransferManager(const size_t &max_concurrent_transfers, const std::uint64_t &default_rate_limit_bytes_per_sec)
    : max_concurrent(max_concurrent_transfers), default_rate_limit(default_rate_limit_bytes_per_sec) {}

TransferResult<Transfer> TransferManager::startTransfer(const TransferSpec &spec) {
    if (!this->canStartTransfer()) {
        return TransferError{TransferErrorCode::MaxTransfers,
            "Maximum concurrent transfers (" + std::to_string(this->max_concurrent) + ") reached", spec.transfer_id};
    }
    if (this->transfers.contains(spec.transfer_id)) {
        return TransferError{TransferErrorCode::InvalidState, "Transfer already exists", spec.transfer_id};
    }

    const auto now = RateLimiter::Clock::now();
    Entry entry;
    Transfer &t = entry.transfer;
    t.id = spec.transfer_id;
    t.session_id = spec.session_id;
    t.connection_id = spec.connection_id;
    t.direction = spec.direction;
    t.remote_path = spec.remote_path;
    t.file_name = spec.file_name;
    t.total_bytes = spec.total_bytes;
    t.status = TransferStatus::Pending;
    t.rate_limiter = std::make_shared<RateLimiter>(spec.rate_limit_bytes_per_sec.value_or(this->default_rate_limit),
                                                   std::chrono::milliseconds(1000), now);
    t.cancel_token = entry.cancel_source.getToken();
    t.started_at = now;
    t.last_chunk_at = now;

    Transfer snapshot = t;
    this->transfers.emplace(spec.transfer_id, std::move(entry));
    return snapshot;
}

TransferResult<Transfer> TransferManager::activateTransfer(const std::string &transfer_id) {
    Entry *entry = this->find(transfer_id);
    if (!entry) {
        return this->notFound(transfer_id);
    }
    if (entry->transfer.status != TransferStatus::Pending) {
        return TransferError{TransferErrorCode::InvalidState,
            std::string("Cannot activate transfer in ") + status_name(entry->transfer.status) + " state", transfer_id};
    }
    entry->transfer.status = TransferStatus::Active;
    entry->transfer.last_chunk_at = RateLimiter::Clock::now();
    return entry->transfer;
}

TransferResult<Transfer> TransferManager::updateProgress(const std::string &transfer_id, const std::uint64_t &chunk_index, const std::uint64_t &byte_count) {
    Entry *entry = this->find(transfer_id);
    if (!entry) {
        return this->notFound(transfer_id);
    }
    Transfer &t = entry->transfer;
    // a paused transfer still accounts for data already in flight
    if (t.status != TransferStatus::Active && t.status != TransferStatus::Paused) {
        return TransferError{TransferErrorCode::InvalidState,
            std::string("Cannot update transfer in ") + status_name(t.status) + " state", transfer_id};
    }
    if (chunk_index != t.next_chunk_index) {
        return TransferError{TransferErrorCode::ChunkMismatch,
            "Expected chunk " + std::to_string(t.next_chunk_index) + ", got " + std::to_string(chunk_index), transfer_id};
    }
    if (t.bytes_transferred + byte_count > t.total_bytes) {
        return TransferError{TransferErrorCode::ChunkMismatch,
            "Chunk " + std::to_string(chunk_index) + " exceeds declared size of " + std::to_string(t.total_bytes) + " bytes", transfer_id};
    }

    t.bytes_transferred += byte_count;
    t.next_chunk_index = chunk_index + 1;
    t.last_chunk_at = RateLimiter::Clock::now();
    return t;
}

TransferResult<RateLimiter::Decision> TransferManager::admit(const std::string &transfer_id, const std::uint64_t &byte_count) {
    Entry *entry = this->find(transfer_id);
    if (!entry) {
        return this->notFound(transfer_id);
    }
    return entry->transfer.rate_limiter->checkAndUpdate(byte_count);
}

TransferResult<TransferProgress> TransferManager::getProgress(const std::string &transfer_id, const RateLimiter::Clock::time_point &now) const {
    const Entry *entry = this->find(transfer_id);
    if (!entry) {
        return this->notFound(transfer_id);
    }
    const Transfer &t = entry->transfer;

    TransferProgress progress;
    progress.transfer_id = t.id;
    progress.direction = t.direction;
    progress.bytes_transferred = t.bytes_transferred;
    progress.total_bytes = t.total_bytes;
    progress.percent_complete = t.total_bytes > 0 ? t.bytes_transferred * 100 / t.total_bytes : 0;
    progress.bytes_per_second = t.rate_limiter->calculateCurrentRate(now);

    // a stalled transfer reports the remaining byte count as seconds (1 B/s floor)
    std::uint64_t remaining = t.total_bytes > t.bytes_transferred ? t.total_bytes - t.bytes_transferred : 0;
    std::uint64_t rate = progress.bytes_per_second > 0 ? progress.bytes_per_second : 1;
    progress.estimated_seconds_remaining = (remaining + rate - 1) / rate;
    return progress;
}

TransferResult<TransferCompletion> TransferManager::completeTransfer(const std::string &transfer_id, const RateLimiter::Clock::time_point &now) {
    Entry *entry = this->find(transfer_id);
    if (!entry) {
        return this->notFound(transfer_id);
    }
    Transfer &t = entry->transfer;
    if (t.status != TransferStatus::Active && t.status != TransferStatus::Pending) {
        return TransferError{TransferErrorCode::InvalidState,
            std::string("Cannot complete transfer in ") + status_name(t.status) + " state", transfer_id};
    }

    TransferCompletion completion;
    completion.transfer_id = t.id;
    completion.direction = t.direction;
    completion.bytes_transferred = t.bytes_transferred;
    completion.duration_ms = t.rate_limiter->getElapsedMs(now);
    completion.average_bytes_per_second = completion.duration_ms > 0 ? t.bytes_transferred * 1000 / completion.duration_ms : 0;

    t.status = TransferStatus::Completed;
    this->transfers.erase(transfer_id);
    return completion;
}

void TransferManager::cancelTransfer(const std::string &transfer_id) {
    Entry *entry = this->find(transfer_id);
    if (!entry) {
        return;
    }
    entry->transfer.status = TransferStatus::Cancelled;
    entry->cancel_source.cancel();
    this->transfers.erase(transfer_id);
}

TransferResult<Ok> TransferManager::failTransfer(const std::string &transfer_id, const std::string &reason) {
    Entry *entry = this->find(transfer_id);
    if (!entry) {
        return this->notFound(transfer_id);
    }
    std::cerr << "[transfer] " << transfer_id << " failed: " << reason << std::endl;
    entry->transfer.status = TransferStatus::Error;
    entry->cancel_source.cancel();
    this->transfers.erase(transfer_id);
    return Ok{};
}

TransferResult<Ok> TransferManager::pauseTransfer(const std::string &transfer_id) {
    Entry *entry = this->find(transfer_id);
    if (!entry) {
        return this->notFound(transfer_id);
    }
    if (entry->transfer.status != TransferStatus::Active) {
        return TransferError{TransferErrorCode::InvalidState,
            std::string("Cannot pause transfer in ") + status_name(entry->transfer.status) + " state", transfer_id};
    }
    entry->transfer.status = TransferStatus::Paused;
    entry->transfer.rate_limiter->pause();
    return Ok{};
}

TransferResult<Ok> TransferManager::resumeTransfer(const std::string &transfer_id) {
    Entry *entry = this->find(transfer_id);
    if (!entry) {
        return this->notFound(transfer_id);
    }
    if (entry->transfer.status != TransferStatus::Paused) {
        return TransferError{TransferErrorCode::InvalidState,
            std::string("Cannot resume transfer in ") + status_name(entry->transfer.status) + " state", transfer_id};
    }
    entry->transfer.status = TransferStatus::Active;
    entry->transfer.rate_limiter->resume();
    return Ok{};
}

std::optional<Transfer> TransferManager::getTransfer(const std::string &transfer_id) const {
    const Entry *entry = this->find(transfer_id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->transfer;
}

TransferResult<Transfer> TransferManager::verifyOwnership(const std::string &transfer_id, const std::string &session_id) const {
    const Entry *entry = this->find(transfer_id);
    if (!entry) {
        return this->notFound(transfer_id);
    }
    if (entry->transfer.session_id != session_id) {
        // same message as an unknown id so foreign sessions cannot probe for ids
        return TransferError{TransferErrorCode::NotOwner, "Transfer not found", transfer_id};
    }
    return entry->transfer;
}

size_t TransferManager::getActiveCount() const {
    size_t count = 0;
    for (const auto &[id, entry] : this->transfers) {
        const TransferStatus status = entry.transfer.status;
        if (status == TransferStatus::Pending || status == TransferStatus::Active || status == TransferStatus::Paused) {
            count++;
        }
    }
    return count;
}

bool TransferManager::canStartTransfer() const {
    return this->getActiveCount() < this->max_concurrent;
}

std::vector<Transfer> TransferManager::getSessionTransfers(const std::string &session_id) const {
    std::vector<Transfer> result;
    for (const auto &[id, entry] : this->transfers) {
        if (entry.transfer.session_id == session_id) {
            result.push_back(entry.transfer);
        }
    }
    return result;
}

size_t TransferManager::cancelSessionTransfers(const std::string &session_id) {
    size_t cancelled = 0;
    for (auto it = this->transfers.begin(); it != this->transfers.end();) {
        if (it->second.transfer.session_id == session_id) {
            it->second.transfer.status = TransferStatus::Cancelled;
            it->second.cancel_source.cancel();
            it = this->transfers.erase(it);
            cancelled++;
        } else {
            ++it;
        }
    }
    return cancelled;
}

size_t TransferManager::getTotalCount() const {
    return this->transfers.size();
}

void TransferManager::clear() {
    for (auto &[id, entry] : this->transfers) {
        entry.cancel_source.cancel();
    }
    this->transfers.clear();
}

TransferManager::Entry *TransferManager::find(const std::string &transfer_id) {
    auto it = this->transfers.find(transfer_id);
    return it == this->transfers.end() ? nullptr : &it->second;
}

const TransferManager::Entry *TransferManager::find(const std::string &transfer_id) const {
    auto it = this->transfers.find(transfer_id);
    return it == this->transfers.end() ? nullptr : &it->second;
}

TransferError TransferManager::notFound(const std::string &transfer_id) const {
    return TransferError{TransferErrorCode::NotFound, "Transfer not found", transfer_id};
}

}
