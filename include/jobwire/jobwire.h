/**
 * @file jobwire.h
 * @brief Main header for the jobwire library
 * @version 0.1.0
 *
 * Include this header to access job submission, status streaming and
 * object storage staging.
 *
 * @code
 * #include <jobwire/jobwire.h>
 *
 * using namespace jobwire;
 *
 * auto client = job_client::builder()
 *     .with_config(client_config::from_environment())
 *     .build();
 * @endcode
 */

#ifndef JOBWIRE_JOBWIRE_H
#define JOBWIRE_JOBWIRE_H

#include <cstdint>
#include <string>

// Core types
#include "jobwire/core/types.h"
#include "jobwire/core/job_types.h"
#include "jobwire/core/deadline.h"
#include "jobwire/core/cancellation.h"

// Configuration
#include "jobwire/config/client_config.h"

// Control API and object storage
#include "jobwire/api/control_api_client.h"
#include "jobwire/storage/object_storage_transfer.h"

// Streaming
#include "jobwire/stream/status_stream_client.h"
#include "jobwire/stream/websocket_channel.h"

// Client
#include "jobwire/client/client_types.h"
#include "jobwire/client/job_client.h"

namespace jobwire {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace jobwire

#endif  // JOBWIRE_JOBWIRE_H
