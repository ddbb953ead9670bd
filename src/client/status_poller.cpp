/**
 * @file status_poller.cpp
 * @brief REST status polling implementation
 */

#include "jobwire/client/status_poller.h"

#include <algorithm>

#include "jobwire/core/logging.h"

namespace jobwire {

status_poller::status_poller(std::shared_ptr<control_api_client> api,
                             std::chrono::milliseconds interval,
                             uint32_t max_consecutive_failures)
    : api_(std::move(api)),
      interval_(std::max(interval, std::chrono::milliseconds{1})),
      max_consecutive_failures_(std::max<uint32_t>(max_consecutive_failures, 1)) {}

auto status_poller::poll_until_final(
    const job_handle& handle,
    const deadline& until,
    const cancellation_token& cancel,
    const status_observer& observer) const -> result<status_event> {
    const auto& job_id = handle.id();

    job_log_context ctx;
    ctx.job_id = job_id;
    ctx.backend = handle.backend();

    job_status_latch latch;
    uint32_t attempt = 0;
    uint32_t failures = 0;

    while (true) {
        if (cancel.is_cancelled()) {
            return unexpected{error{error_code::cancelled,
                "Status polling for job " + job_id + " was cancelled"}};
        }
        if (until.expired()) {
            return unexpected{error{error_code::timeout,
                "No final status for job " + job_id + " before the deadline"}};
        }

        ++attempt;
        ctx.attempt = attempt;
        auto status = api_->job_status(job_id);
        if (!status) {
            ++failures;
            ctx.error_message = status.error().message;
            JW_LOG_WARN_CTX(log_category::poller, "Status poll failed", ctx);
            if (failures >= max_consecutive_failures_) {
                return unexpected{status.error()};
            }
        } else {
            failures = 0;
            ctx.error_message.reset();
            auto& event = status.value();
            if (latch.observe(event.status)) {
                ctx.status = to_string(event.status);
                JW_LOG_DEBUG_CTX(log_category::poller, "Status polled", ctx);
                if (observer) {
                    observer(event);
                }
                if (is_terminal(event.status)) {
                    return std::move(event);
                }
            }
        }

        if (until.expired()) {
            return unexpected{error{error_code::timeout,
                "No final status for job " + job_id + " before the deadline"}};
        }
        if (cancel.wait_for(until.clamp(interval_))) {
            return unexpected{error{error_code::cancelled,
                "Status polling for job " + job_id + " was cancelled"}};
        }
    }
}

}  // namespace jobwire
