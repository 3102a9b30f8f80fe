#pragma once

#include "config.hpp"
#include "error.hpp"
#include "path_validator.hpp"
#include "remote.hpp"
#include "result.hpp"
#include "timer_queue.hpp"
#include "transfer_manager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace webxfer {

// status reported to a callback whose remote call did not complete in time
constexpr int REMOTE_TIMEOUT_STATUS = -1;

Error map_remote_error(const RemoteError &error, const std::string &path = "");
Error map_command_error(const std::string &stderr_text, const int &exit_code, const std::string &path = "");
Error map_path_error(const PathError &error, const std::string &path);
Error map_transfer_error(const TransferError &error);

PathValidationOptions validation_options(const SftpConfig &config, const bool &check_extension);
// Enabled check and path validation, the local part of every operation's preamble.
Result<std::string> check_request_path(const SftpConfig &config, const std::string &path, const bool &check_extension);
// Replaces a leading "~" with `home`.
std::string substitute_home(const std::string &path, const std::string &home);

Error with_transfer(Error error, const std::string &transfer_id);
// A chunk may not run past the declared size, and the last chunk must end exactly on it.
std::optional<Error> check_chunk_bounds(const Transfer &transfer, const std::uint64_t &chunk_bytes, const bool &is_last);

// Wraps a remote completion so it fires at most once: with the remote result,
// or with a REMOTE_TIMEOUT_STATUS error once `timeout` elapses.
template <typename... Rest>
std::function<void(RemoteStatus, Rest...)> with_timeout(Scheduler &scheduler,
                                                        const std::chrono::milliseconds &timeout,
                                                        std::type_identity_t<std::function<void(RemoteStatus, Rest...)>> done) {
    auto fired = std::make_shared<bool>(false);
    auto callback = std::make_shared<std::function<void(RemoteStatus, Rest...)>>(std::move(done));
    TimerId timer = scheduler.schedule(timeout, [fired, callback]() {
        if (*fired) {
            return;
        }
        *fired = true;
        (*callback)(RemoteError{REMOTE_TIMEOUT_STATUS, "Operation timed out"}, Rest{}...);
    });
    Scheduler *sched = &scheduler;
    return [fired, callback, timer, sched](RemoteStatus status, Rest... rest) {
        if (*fired) {
            return;
        }
        *fired = true;
        sched->cancel(timer);
        (*callback)(std::move(status), std::move(rest)...);
    };
}

}
