/**
 * @file status_stream_client.cpp
 * @brief Streaming status client implementation
 */

#include "jobwire/stream/status_stream_client.h"

#include "jobwire/core/logging.h"
#include "jobwire/http/http_utils.h"
#include "jobwire/stream/status_frame.h"

namespace jobwire {

namespace {

/**
 * @brief Closes the channel on scope exit
 */
class channel_guard {
public:
    explicit channel_guard(std::shared_ptr<transport_channel> channel)
        : channel_(std::move(channel)) {}

    ~channel_guard() {
        channel_->close();
    }

    channel_guard(const channel_guard&) = delete;
    auto operator=(const channel_guard&) -> channel_guard& = delete;

private:
    std::shared_ptr<transport_channel> channel_;
};

auto cancelled_error(const std::string& job_id) -> unexpected {
    return unexpected{error{error_code::cancelled,
        "Status wait for job " + job_id + " was cancelled"}};
}

auto timeout_error(const std::string& job_id) -> unexpected {
    return unexpected{error{error_code::timeout,
        "No final status for job " + job_id + " before the deadline"}};
}

}  // namespace

status_stream_client::status_stream_client(std::string stream_url,
                                           std::string credential,
                                           std::shared_ptr<channel_factory> factory)
    : stream_url_(std::move(stream_url)),
      credential_(std::move(credential)),
      factory_(std::move(factory)) {}

auto status_stream_client::endpoint_for(const std::string& job_id) const -> std::string {
    return http_utils::join_url(stream_url_,
                                "/jobs/" + http_utils::url_encode(job_id) + "/status");
}

auto status_stream_client::wait_for_final_status(
    const job_handle& handle,
    const deadline& until,
    const cancellation_token& cancel,
    const status_observer& observer) const -> result<status_event> {
    const auto& job_id = handle.id();

    if (!factory_) {
        return unexpected{error{error_code::internal_error, "No channel factory"}};
    }
    std::shared_ptr<transport_channel> channel = factory_->create();
    if (!channel) {
        return unexpected{error{error_code::internal_error, "Channel factory returned null"}};
    }

    channel_guard guard(channel);
    cancellation_registration on_cancel(cancel, [channel] { channel->close(); });

    if (cancel.is_cancelled()) {
        return cancelled_error(job_id);
    }
    if (until.expired()) {
        return timeout_error(job_id);
    }

    job_log_context ctx;
    ctx.job_id = job_id;
    ctx.backend = handle.backend();
    ctx.endpoint = endpoint_for(job_id);

    // The handshake shares the wait's budget
    auto opened = channel->open(*ctx.endpoint, credential_, until.remaining());
    if (!opened) {
        if (cancel.is_cancelled()) {
            return cancelled_error(job_id);
        }
        if (until.expired()) {
            JW_LOG_WARN_CTX(log_category::stream, "Deadline reached while connecting", ctx);
            return timeout_error(job_id);
        }
        ctx.error_message = opened.error().message;
        JW_LOG_WARN_CTX(log_category::stream, "Status stream unavailable", ctx);
        return opened.error().category() == error_category::connect
            ? unexpected{opened.error()}
            : unexpected{error{error_code::connect_failed, opened.error().message}};
    }

    if (auto sent = channel->send(make_subscribe_frame(job_id, credential_)); !sent) {
        if (cancel.is_cancelled()) {
            return cancelled_error(job_id);
        }
        return unexpected{error{error_code::protocol_error,
            "Subscribe failed: " + sent.error().message}};
    }

    JW_LOG_DEBUG_CTX(log_category::stream, "Subscribed to status stream", ctx);

    job_status_latch latch;
    while (true) {
        if (cancel.is_cancelled()) {
            return cancelled_error(job_id);
        }
        if (until.expired()) {
            JW_LOG_WARN_CTX(log_category::stream, "Status stream deadline reached", ctx);
            return timeout_error(job_id);
        }

        auto text = channel->receive(until.remaining());
        if (!text) {
            if (cancel.is_cancelled()) {
                return cancelled_error(job_id);
            }
            if (text.error().code == error_code::channel_timeout) {
                continue;
            }
            ctx.error_message = text.error().message;
            JW_LOG_WARN_CTX(log_category::stream,
                "Status stream closed before a final status", ctx);
            return unexpected{error{error_code::protocol_error,
                "Stream closed before a final status: " + text.error().message}};
        }

        auto frame = parse_status_frame(text.value(), job_id);
        if (!frame) {
            ctx.error_message = frame.error().message;
            JW_LOG_WARN_CTX(log_category::stream, "Undecodable status frame", ctx);
            return unexpected{frame.error()};
        }

        switch (frame.value().kind) {
            case frame_kind::authenticated:
                continue;
            case frame_kind::auth_rejected:
                ctx.error_message = frame.value().detail;
                JW_LOG_ERROR_CTX(log_category::stream, "Status stream rejected credential", ctx);
                return unexpected{error{error_code::auth_rejected,
                    "Stream subscription rejected: " + frame.value().detail}};
            case frame_kind::status:
                break;
        }

        auto& event = frame.value().event;
        if (!latch.observe(event.status)) {
            continue;
        }
        ctx.status = to_string(event.status);
        JW_LOG_DEBUG_CTX(log_category::stream, "Status update", ctx);
        if (observer) {
            observer(event);
        }
        if (is_terminal(event.status)) {
            return std::move(event);
        }
    }
}

}  // namespace jobwire
