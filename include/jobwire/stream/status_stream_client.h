/**
 * @file status_stream_client.h
 * @brief Waits for a job's final status over a streaming channel
 * @version 0.1.0
 */

#ifndef JOBWIRE_STREAM_STATUS_STREAM_CLIENT_H
#define JOBWIRE_STREAM_STATUS_STREAM_CLIENT_H

#include <functional>
#include <memory>
#include <string>

#include "jobwire/core/cancellation.h"
#include "jobwire/core/deadline.h"
#include "jobwire/core/job_types.h"
#include "jobwire/core/types.h"
#include "jobwire/stream/transport_channel.h"

namespace jobwire {

/**
 * @brief Receives every accepted status event, terminal or not
 */
using status_observer = std::function<void(const status_event&)>;

/**
 * @brief Streaming status client
 *
 * Each wait opens its own channel and closes it before returning, so one
 * instance can serve concurrent waits for different jobs.
 *
 * Outcome of wait_for_final_status():
 * - terminal status_event on success
 * - error_code::timeout when the deadline passes (not fallback eligible)
 * - error_code::cancelled when the token fires
 * - connect category error when the channel cannot be opened or the
 *   subscription is rejected
 * - error_code::protocol_error for an undecodable frame or a channel that
 *   closes before a terminal status
 */
class status_stream_client {
public:
    /**
     * @param stream_url Base URL, e.g. wss://stream.example.com
     * @param credential Bearer credential sent in the subscribe frame
     * @param factory Source of fresh channels
     */
    status_stream_client(std::string stream_url,
                         std::string credential,
                         std::shared_ptr<channel_factory> factory);

    /**
     * @brief Block until @p handle reaches a terminal status
     *
     * The deadline is a single end-to-end budget; non-terminal frames do
     * not extend it.
     */
    [[nodiscard]] auto wait_for_final_status(
        const job_handle& handle,
        const deadline& until,
        const cancellation_token& cancel = {},
        const status_observer& observer = {}) const -> result<status_event>;

    /**
     * @brief "<stream_url>/jobs/<id>/status"
     */
    [[nodiscard]] auto endpoint_for(const std::string& job_id) const -> std::string;

private:
    std::string stream_url_;
    std::string credential_;
    std::shared_ptr<channel_factory> factory_;
};

}  // namespace jobwire

#endif  // JOBWIRE_STREAM_STATUS_STREAM_CLIENT_H
