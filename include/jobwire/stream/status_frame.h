/**
 * @file status_frame.h
 * @brief Decoding of streaming status frames
 *
 * Accepted forms:
 * @code
 * {"job_id": "abc", "status": "RUNNING"}
 * {"type": "job-status", "data": {"job_id": "abc", "status": "COMPLETED"}}
 * {"type": "authenticated"}
 * {"type": "authentication-failed", "data": "reason"}
 * @endcode
 */

#ifndef JOBWIRE_STREAM_STATUS_FRAME_H
#define JOBWIRE_STREAM_STATUS_FRAME_H

#include <string>

#include "jobwire/core/job_types.h"
#include "jobwire/core/types.h"

namespace jobwire {

/**
 * @brief What a decoded frame carries
 */
enum class frame_kind {
    status,         ///< A job status update
    authenticated,  ///< Subscription accepted
    auth_rejected   ///< Subscription rejected
};

/**
 * @brief A decoded frame
 */
struct status_frame {
    frame_kind kind = frame_kind::status;
    status_event event;   ///< Valid when kind == status
    std::string detail;   ///< Server text for auth frames
};

/**
 * @brief Build the subscribe frame sent after opening the stream
 */
[[nodiscard]] auto make_subscribe_frame(const std::string& job_id,
                                        const std::string& credential) -> std::string;

/**
 * @brief Decode one text frame for @p job_id
 *
 * @return status_frame, or error_code::protocol_error for non-JSON text, a
 *         non-object, a missing or non-string status, an unknown status
 *         name, a job_id that does not match, or an unknown frame type.
 */
[[nodiscard]] auto parse_status_frame(const std::string& text,
                                      const std::string& job_id) -> result<status_frame>;

}  // namespace jobwire

#endif  // JOBWIRE_STREAM_STATUS_FRAME_H
