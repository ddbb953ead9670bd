/**
 * @file status_poller.h
 * @brief Fixed-interval REST status polling
 */

#ifndef JOBWIRE_CLIENT_STATUS_POLLER_H
#define JOBWIRE_CLIENT_STATUS_POLLER_H

#include <chrono>
#include <cstdint>
#include <memory>

#include "jobwire/api/control_api_client.h"
#include "jobwire/core/cancellation.h"
#include "jobwire/core/deadline.h"
#include "jobwire/core/job_types.h"
#include "jobwire/core/types.h"
#include "jobwire/stream/status_stream_client.h"

namespace jobwire {

/**
 * @brief Polls GET /jobs/{id}/status until the job is terminal
 *
 * The deadline is checked before every sleep and every sleep is clamped to
 * the remaining budget, so a wait never overshoots the deadline by more
 * than one request. Cancellation interrupts the sleep.
 */
class status_poller {
public:
    /// Consecutive failed requests tolerated before giving up
    static constexpr uint32_t default_max_consecutive_failures = 3;

    status_poller(std::shared_ptr<control_api_client> api,
                  std::chrono::milliseconds interval,
                  uint32_t max_consecutive_failures = default_max_consecutive_failures);

    [[nodiscard]] auto poll_until_final(
        const job_handle& handle,
        const deadline& until,
        const cancellation_token& cancel = {},
        const status_observer& observer = {}) const -> result<status_event>;

    [[nodiscard]] auto interval() const noexcept -> std::chrono::milliseconds {
        return interval_;
    }

private:
    std::shared_ptr<control_api_client> api_;
    std::chrono::milliseconds interval_;
    uint32_t max_consecutive_failures_;
};

}  // namespace jobwire

#endif  // JOBWIRE_CLIENT_STATUS_POLLER_H
