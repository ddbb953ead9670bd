/**
 * @file websocket_channel.cpp
 * @brief WebSocket channel implementation
 */

#include "jobwire/stream/websocket_channel.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "jobwire/config/feature_flags.h"
#include "jobwire/core/logging.h"
#include "jobwire/http/http_utils.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/messaging_ws_client.h>
#endif

namespace jobwire {

struct websocket_channel::impl {
    std::chrono::milliseconds connect_timeout;
    std::atomic<channel_state> current_state{channel_state::idle};
    std::string endpoint;

    // Receive buffer
    mutable std::mutex receive_mutex;
    std::condition_variable receive_cv;
    std::queue<std::string> receive_queue;
    std::string last_error;
    bool started{false};
    bool closed_locally{false};
    std::atomic<bool> stopped{false};

#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::messaging_ws_client> network_client;
#endif

    explicit impl(std::chrono::milliseconds timeout) : connect_timeout(timeout) {}

    void set_state(channel_state new_state) {
        auto old_state = current_state.exchange(new_state);
        if (old_state != new_state) {
            JW_LOG_TRACE(log_category::channel,
                "WebSocket channel state changed: " +
                std::string(to_string(old_state)) + " -> " +
                std::string(to_string(new_state)));
        }
    }

    void push_frame(const std::string& text) {
        {
            std::lock_guard lock(receive_mutex);
            if (current_state == channel_state::closed) {
                return;
            }
            receive_queue.push(text);
        }
        receive_cv.notify_all();
    }

    void mark_closed(const std::string& reason) {
        {
            std::lock_guard lock(receive_mutex);
            if (last_error.empty()) {
                last_error = reason;
            }
            set_state(channel_state::closed);
        }
        receive_cv.notify_all();
    }

    /**
     * @brief Stop the network client once it was started
     *
     * Both close() and open() may get here; only the first call stops.
     */
    void stop_network() {
        if (stopped.exchange(true)) {
            return;
        }
#if KCENON_WITH_NETWORK_SYSTEM
        if (network_client) {
            auto result = network_client->stop_client();
            if (result.is_err()) {
                JW_LOG_WARN(log_category::channel,
                    "WebSocket stop failed: " + result.error().message);
            }
        }
#endif
    }

    void mark_connected() {
        {
            std::lock_guard lock(receive_mutex);
            if (current_state == channel_state::connecting) {
                set_state(channel_state::open);
            }
        }
        receive_cv.notify_all();
    }
};

websocket_channel::websocket_channel(std::chrono::milliseconds connect_timeout)
    : impl_(std::make_shared<impl>(connect_timeout)) {}

websocket_channel::~websocket_channel() {
    close();
}

namespace {

auto closed_before_open(const std::string& endpoint) -> unexpected {
    return unexpected{error{error_code::channel_closed,
        "Channel to " + endpoint + " was closed before it opened"}};
}

}  // namespace

auto websocket_channel::open(const std::string& endpoint,
                             const std::string& credential,
                             std::chrono::milliseconds timeout) -> result<void> {
    {
        std::lock_guard lock(impl_->receive_mutex);
        if (impl_->current_state == channel_state::closed) {
            return closed_before_open(endpoint);
        }
        if (impl_->current_state != channel_state::idle) {
            return unexpected{error{error_code::invalid_argument,
                "Channel can only be opened once"}};
        }
    }

    auto parsed = http_utils::parse_url(endpoint);
    if (!parsed) {
        return unexpected{parsed.error()};
    }
    const auto& url = parsed.value();
    if (url.scheme != "ws" && url.scheme != "wss") {
        return unexpected{error{error_code::malformed_url,
            "Stream URL must use ws or wss: " + endpoint}};
    }
    if (credential.empty()) {
        return unexpected{error{error_code::missing_credential,
            "No credential for stream " + endpoint}};
    }

#if KCENON_WITH_NETWORK_SYSTEM
    auto client = std::make_shared<kcenon::network::core::messaging_ws_client>("jobwire_stream");

    std::weak_ptr<impl> weak = impl_;
    client->set_text_message_callback(
        [weak](const std::string& text) {
            if (auto self = weak.lock()) {
                self->push_frame(text);
            }
        });
    client->set_connected_callback(
        [weak]() {
            if (auto self = weak.lock()) {
                self->mark_connected();
            }
        });
    client->set_disconnected_callback(
        [weak](auto /*code*/, const std::string& reason) {
            if (auto self = weak.lock()) {
                self->mark_closed(reason.empty() ? "Connection closed by peer" : reason);
            }
        });
    client->set_error_callback(
        [weak](std::error_code ec) {
            if (auto self = weak.lock()) {
                self->mark_closed(ec.message());
            }
        });

    std::string path = url.path;
    if (!url.query.empty()) {
        path += "?" + url.query;
    }

    // A close() racing with open() either sees the client as started and
    // stops it, or leaves it for open() to stop below.
    {
        std::lock_guard lock(impl_->receive_mutex);
        if (impl_->current_state != channel_state::idle) {
            return closed_before_open(endpoint);
        }
        impl_->endpoint = endpoint;
        impl_->network_client = client;
        impl_->set_state(channel_state::connecting);
    }

    JW_LOG_DEBUG(log_category::channel,
        "WebSocket connecting to " + url.host + ":" + std::to_string(url.port) + url.path);

    auto started = client->start_client(url.host, url.port, path);
    bool closed_meanwhile = false;
    {
        std::lock_guard lock(impl_->receive_mutex);
        impl_->started = true;
        closed_meanwhile = impl_->closed_locally;
    }
    if (closed_meanwhile) {
        impl_->stop_network();
        return closed_before_open(endpoint);
    }
    if (started.is_err()) {
        impl_->mark_closed(started.error().message);
        impl_->stop_network();
        JW_LOG_WARN(log_category::channel,
            "WebSocket connection failed: " + started.error().message);
        return unexpected{error{error_code::host_unreachable,
            "Cannot connect to " + endpoint + ": " + started.error().message}};
    }

    if (client->is_connected()) {
        impl_->mark_connected();
    }

    auto handshake_budget = std::clamp(timeout, std::chrono::milliseconds{0},
                                       impl_->connect_timeout);
    std::unique_lock lock(impl_->receive_mutex);
    bool settled = impl_->receive_cv.wait_for(lock, handshake_budget,
        [this] { return impl_->current_state != channel_state::connecting; });

    if (!settled) {
        lock.unlock();
        close();
        return unexpected{error{error_code::connect_failed,
            "WebSocket handshake with " + endpoint + " timed out"}};
    }
    if (impl_->current_state != channel_state::open) {
        auto reason = impl_->last_error;
        lock.unlock();
        close();
        return unexpected{error{error_code::connect_failed,
            "WebSocket handshake with " + endpoint + " rejected: " + reason}};
    }

    JW_LOG_DEBUG(log_category::channel, "WebSocket connected to " + endpoint);
    return {};
#else
    (void)timeout;
    return unexpected{error{error_code::network_unavailable,
        "WebSocket client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto websocket_channel::send(const std::string& text) -> result<void> {
    if (impl_->current_state != channel_state::open) {
        return unexpected{error{error_code::channel_closed,
            "Channel is not open"}};
    }

#if KCENON_WITH_NETWORK_SYSTEM
    auto sent = impl_->network_client->send_text(std::string(text));
    if (sent.is_err()) {
        return unexpected{error{error_code::channel_closed,
            "Send failed: " + sent.error().message}};
    }
    return {};
#else
    (void)text;
    return unexpected{error{error_code::network_unavailable,
        "WebSocket client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto websocket_channel::receive(std::chrono::milliseconds timeout) -> result<std::string> {
    std::unique_lock lock(impl_->receive_mutex);

    if (impl_->receive_queue.empty()) {
        bool ready = impl_->receive_cv.wait_for(lock, timeout,
            [this] { return !impl_->receive_queue.empty() ||
                            impl_->current_state == channel_state::closed; });

        if (!ready) {
            return unexpected{error{error_code::channel_timeout, "Receive timeout"}};
        }
    }

    if (impl_->receive_queue.empty()) {
        auto reason = impl_->last_error.empty() ? std::string("Channel closed")
                                                : impl_->last_error;
        return unexpected{error{error_code::channel_closed, reason}};
    }

    auto frame = std::move(impl_->receive_queue.front());
    impl_->receive_queue.pop();
    return frame;
}

void websocket_channel::close() {
    bool was_closed = false;
    bool started = false;
    {
        std::lock_guard lock(impl_->receive_mutex);
        was_closed = impl_->closed_locally;
        impl_->closed_locally = true;
        impl_->set_state(channel_state::closed);
        if (impl_->last_error.empty()) {
            impl_->last_error = "Channel closed locally";
        }
        started = impl_->started;
        // Frames buffered before a local close are discarded
        std::queue<std::string>().swap(impl_->receive_queue);
    }
    impl_->receive_cv.notify_all();

    if (started) {
        impl_->stop_network();
    }
    if (!was_closed) {
        JW_LOG_DEBUG(log_category::channel, "WebSocket channel closed");
    }
}

auto websocket_channel::state() const -> channel_state {
    return impl_->current_state;
}

}  // namespace jobwire
