/**
 * @file websocket_channel.h
 * @brief WebSocket transport channel over network_system
 * @version 0.1.0
 */

#ifndef JOBWIRE_STREAM_WEBSOCKET_CHANNEL_H
#define JOBWIRE_STREAM_WEBSOCKET_CHANNEL_H

#include <chrono>
#include <memory>
#include <string>

#include "jobwire/stream/transport_channel.h"

namespace jobwire {

/**
 * @brief transport_channel backed by network_system's WebSocket client
 *
 * Incoming text frames are queued by the network thread and handed out by
 * receive(). The credential is only checked for presence here; the status
 * stream authenticates in its subscribe frame.
 *
 * Without KCENON_WITH_NETWORK_SYSTEM, open() fails with
 * error_code::network_unavailable.
 */
class websocket_channel : public transport_channel {
public:
    explicit websocket_channel(
        std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(10000));

    ~websocket_channel() override;

    websocket_channel(const websocket_channel&) = delete;
    auto operator=(const websocket_channel&) -> websocket_channel& = delete;

    /**
     * @brief Connect and wait for the handshake
     *
     * The handshake wait is the smaller of @p timeout and the channel's
     * connect timeout. A close() before or during open() makes it fail with
     * error_code::channel_closed and leaves no connection behind.
     */
    [[nodiscard]] auto open(const std::string& endpoint,
                            const std::string& credential,
                            std::chrono::milliseconds timeout) -> result<void> override;

    [[nodiscard]] auto send(const std::string& text) -> result<void> override;

    [[nodiscard]] auto receive(std::chrono::milliseconds timeout)
        -> result<std::string> override;

    void close() override;

    [[nodiscard]] auto state() const -> channel_state override;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

/**
 * @brief Factory for websocket_channel
 */
class websocket_channel_factory : public channel_factory {
public:
    explicit websocket_channel_factory(
        std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(10000))
        : connect_timeout_(connect_timeout) {}

    [[nodiscard]] auto create() -> std::unique_ptr<transport_channel> override {
        return std::make_unique<websocket_channel>(connect_timeout_);
    }

private:
    std::chrono::milliseconds connect_timeout_;
};

}  // namespace jobwire

#endif  // JOBWIRE_STREAM_WEBSOCKET_CHANNEL_H
