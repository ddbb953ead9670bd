/**
 * @file client_types.h
 * @brief Types for job_client
 */

#ifndef JOBWIRE_CLIENT_CLIENT_TYPES_H
#define JOBWIRE_CLIENT_CLIENT_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "jobwire/core/cancellation.h"
#include "jobwire/core/job_types.h"
#include "jobwire/core/types.h"
#include "jobwire/stream/status_stream_client.h"

namespace jobwire {

/**
 * @brief Stage of one submit_and_wait call
 *
 * submitting -> awaiting_status -> (streaming | polling) -> terminal
 *            -> [fetching_result] -> done
 *
 * streaming is followed by polling when the stream fails over.
 */
enum class orchestrator_state {
    submitting,
    awaiting_status,
    streaming,
    polling,
    terminal,
    fetching_result,
    done
};

[[nodiscard]] constexpr auto to_string(orchestrator_state state) -> const char* {
    switch (state) {
        case orchestrator_state::submitting: return "submitting";
        case orchestrator_state::awaiting_status: return "awaiting_status";
        case orchestrator_state::streaming: return "streaming";
        case orchestrator_state::polling: return "polling";
        case orchestrator_state::terminal: return "terminal";
        case orchestrator_state::fetching_result: return "fetching_result";
        case orchestrator_state::done: return "done";
        default: return "unknown";
    }
}

/**
 * @brief Which path observed the final status
 */
enum class monitor_path {
    stream,
    polling
};

[[nodiscard]] constexpr auto to_string(monitor_path path) -> const char* {
    switch (path) {
        case monitor_path::stream: return "stream";
        case monitor_path::polling: return "polling";
        default: return "unknown";
    }
}

/**
 * @brief Result of submit_and_wait
 */
struct job_outcome {
    job_handle handle;
    job_status final_status;

    /// Result body, present only when final_status is completed
    std::optional<std::vector<uint8_t>> result;

    monitor_path monitored_by = monitor_path::stream;

    /// Stream failure that caused the switch to polling
    std::optional<error> fallback_reason;
};

/**
 * @brief Per-call options for submit_and_wait
 */
struct wait_options {
    /// Cancels the wait; the job itself is not cancelled on the service
    cancellation_token cancel;

    /// Every accepted status event from either path
    status_observer on_status;

    /// Overrides client_config::mode for this call
    std::optional<submission_mode> mode;

    /// Job name sent with the submission
    std::optional<std::string> name;
};

/**
 * @brief State change notification: (job id or empty while submitting, state)
 */
using state_callback = std::function<void(const std::string&, orchestrator_state)>;

}  // namespace jobwire

#endif  // JOBWIRE_CLIENT_CLIENT_TYPES_H
