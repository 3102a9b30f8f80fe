#pragma once

#include "cancellation.hpp"
#include "rate_limiter.hpp"
#include "result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace webxfer {

enum class TransferDirection {
    Upload,
    Download
};

enum class TransferStatus {
    Pending,
    Active,
    Paused,
    Completed,
    Cancelled,
    Error
};

const char *direction_name(const TransferDirection &direction);
const char *status_name(const TransferStatus &status);

enum class TransferErrorCode {
    NotFound,
    NotOwner,
    MaxTransfers,
    InvalidState,
    ChunkMismatch
};

struct TransferError {
    TransferErrorCode code;
    std::string message;
    std::string transfer_id;
};

struct TransferSpec {
    std::string transfer_id;
    std::string session_id;
    std::string connection_id;
    TransferDirection direction = TransferDirection::Upload;
    std::string remote_path;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::optional<std::uint64_t> rate_limit_bytes_per_sec;
};

// Registry entry. Copies share the rate limiter and the cancellation flag with the registry.
struct Transfer {
    std::string id;
    std::string session_id;
    std::string connection_id;
    TransferDirection direction = TransferDirection::Upload;
    std::string remote_path;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_transferred = 0;
    TransferStatus status = TransferStatus::Pending;
    std::uint64_t next_chunk_index = 0;
    std::shared_ptr<RateLimiter> rate_limiter;
    CancellationToken cancel_token;
    RateLimiter::Clock::time_point started_at;
    RateLimiter::Clock::time_point last_chunk_at;
};

struct TransferProgress {
    std::string transfer_id;
    TransferDirection direction = TransferDirection::Upload;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t percent_complete = 0;
    std::uint64_t bytes_per_second = 0;
    std::uint64_t estimated_seconds_remaining = 0;
};

struct TransferCompletion {
    std::string transfer_id;
    TransferDirection direction = TransferDirection::Upload;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t duration_ms = 0;
    std::uint64_t average_bytes_per_second = 0;
};

template <typename T>
using TransferResult = Result<T, TransferError>;

class TransferManager {
public:
    explicit TransferManager(const size_t &max_concurrent_transfers, const std::uint64_t &default_rate_limit_bytes_per_sec = 0);

    TransferResult<Transfer> startTransfer(const TransferSpec &spec);
    TransferResult<Transfer> activateTransfer(const std::string &transfer_id);
    TransferResult<Transfer> updateProgress(const std::string &transfer_id, const std::uint64_t &chunk_index, const std::uint64_t &byte_count);
    TransferResult<RateLimiter::Decision> admit(const std::string &transfer_id, const std::uint64_t &byte_count);
    TransferResult<TransferProgress> getProgress(const std::string &transfer_id, const RateLimiter::Clock::time_point &now = RateLimiter::Clock::now()) const;
    TransferResult<TransferCompletion> completeTransfer(const std::string &transfer_id, const RateLimiter::Clock::time_point &now = RateLimiter::Clock::now());
    void cancelTransfer(const std::string &transfer_id);
    TransferResult<Ok> failTransfer(const std::string &transfer_id, const std::string &reason);
    TransferResult<Ok> pauseTransfer(const std::string &transfer_id);
    TransferResult<Ok> resumeTransfer(const std::string &transfer_id);

    std::optional<Transfer> getTransfer(const std::string &transfer_id) const;
    TransferResult<Transfer> verifyOwnership(const std::string &transfer_id, const std::string &session_id) const;

    size_t getActiveCount() const;
    bool canStartTransfer() const;
    std::vector<Transfer> getSessionTransfers(const std::string &session_id) const;
    size_t cancelSessionTransfers(const std::string &session_id);
    size_t getTotalCount() const;
    void clear();

private:
    struct Entry {
        Transfer transfer;
        CancellationSource cancel_source;
    };

    const size_t max_concurrent;
    const std::uint64_t default_rate_limit;
    std::unordered_map<std::string, Entry> transfers;

    Entry *find(const std::string &transfer_id);
    const Entry *find(const std::string &transfer_id) const;
    TransferError notFound(const std::string &transfer_id) const;
};

}
