/**
 * @file transport_channel.h
 * @brief Streaming channel abstraction
 * @version 0.1.0
 *
 * A transport_channel is one bidirectional text connection. It is opened
 * once, never reconnects, and is discarded after close().
 */

#ifndef JOBWIRE_STREAM_TRANSPORT_CHANNEL_H
#define JOBWIRE_STREAM_TRANSPORT_CHANNEL_H

#include <chrono>
#include <memory>
#include <string>

#include "jobwire/core/types.h"

namespace jobwire {

/**
 * @brief Channel state enumeration
 */
enum class channel_state {
    idle,        ///< Not opened yet
    connecting,  ///< Handshake in progress
    open,        ///< Ready for send/receive
    closed       ///< Closed locally or by the peer
};

[[nodiscard]] constexpr auto to_string(channel_state state) -> const char* {
    switch (state) {
        case channel_state::idle: return "idle";
        case channel_state::connecting: return "connecting";
        case channel_state::open: return "open";
        case channel_state::closed: return "closed";
        default: return "unknown";
    }
}

/**
 * @brief Abstract streaming channel
 */
class transport_channel {
public:
    virtual ~transport_channel() = default;

    /**
     * @brief Connect to @p endpoint, giving up after @p timeout
     *
     * Fails with a connect category error: malformed_url, missing_credential,
     * host_unreachable or connect_failed (handshake rejected or timed out).
     * Fails with error_code::channel_closed when close() wins the race.
     */
    [[nodiscard]] virtual auto open(const std::string& endpoint,
                                    const std::string& credential,
                                    std::chrono::milliseconds timeout) -> result<void> = 0;

    /**
     * @brief Send one text frame
     */
    [[nodiscard]] virtual auto send(const std::string& text) -> result<void> = 0;

    /**
     * @brief Wait up to @p timeout for the next text frame
     *
     * Fails with error_code::channel_timeout when nothing arrives in time
     * and error_code::channel_closed once the channel is closed and no
     * buffered frames remain.
     */
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout)
        -> result<std::string> = 0;

    /**
     * @brief Close the channel
     *
     * Idempotent and safe to call from another thread; a blocked receive()
     * wakes with error_code::channel_closed.
     */
    virtual void close() = 0;

    [[nodiscard]] virtual auto state() const -> channel_state = 0;
};

/**
 * @brief Creates fresh channels, one per wait attempt
 */
class channel_factory {
public:
    virtual ~channel_factory() = default;

    /**
     * @brief Create an unopened channel
     * @return Channel instance or nullptr on failure
     */
    [[nodiscard]] virtual auto create() -> std::unique_ptr<transport_channel> = 0;
};

}  // namespace jobwire

#endif  // JOBWIRE_STREAM_TRANSPORT_CHANNEL_H
