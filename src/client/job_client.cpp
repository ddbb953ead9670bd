/**
 * @file job_client.cpp
 * @brief Job submission orchestrator implementation
 */

#include "jobwire/client/job_client.h"

#include <mutex>

#include "jobwire/client/status_poller.h"
#include "jobwire/core/logging.h"
#include "jobwire/storage/object_storage_transfer.h"
#include "jobwire/storage/payload_codec.h"
#include "jobwire/stream/status_stream_client.h"
#include "jobwire/stream/websocket_channel.h"

namespace jobwire {

using json = nlohmann::json;

// ============================================================================
// Implementation
// ============================================================================

struct job_client::impl {
    client_config config;
    std::shared_ptr<control_api_client> api;
    object_storage_transfer transfer;
    status_stream_client stream;
    status_poller poller;

    std::mutex callback_mutex;
    state_callback state_changed;

    impl(client_config cfg,
         std::shared_ptr<control_api_client> api_client,
         std::shared_ptr<http_client_interface> http,
         std::shared_ptr<channel_factory> factory)
        : config(std::move(cfg)),
          api(std::move(api_client)),
          transfer(api, std::move(http), config.locator_default_ttl),
          stream(config.stream_url, config.credential, std::move(factory)),
          poller(api, config.poll_interval) {}

    void notify(const std::string& job_id, orchestrator_state state) {
        JW_LOG_TRACE(log_category::client,
            "Job " + (job_id.empty() ? std::string("<pending>") : job_id) +
            " -> " + to_string(state));
        state_callback callback;
        {
            std::lock_guard lock(callback_mutex);
            callback = state_changed;
        }
        if (callback) {
            callback(job_id, state);
        }
    }

    auto ensure_connected() -> result<void> {
        if (api->is_connected()) {
            return {};
        }
        return api->connect();
    }

    auto resolve_mode(const std::vector<uint8_t>& payload,
                      const wait_options& options) const -> result<submission_mode> {
        auto requested = options.mode.value_or(config.mode);
        bool json_payload = payload_codec::is_json(payload);

        switch (requested) {
            case submission_mode::inline_only:
                if (!json_payload) {
                    return unexpected{error{error_code::invalid_payload,
                        "Inline submission requires a JSON payload"}};
                }
                return submission_mode::inline_only;
            case submission_mode::object_storage:
                return submission_mode::object_storage;
            case submission_mode::automatic:
            default:
                if (!json_payload || payload.size() > config.object_storage_threshold) {
                    return submission_mode::object_storage;
                }
                return submission_mode::inline_only;
        }
    }

    auto submit(const std::vector<uint8_t>& payload,
                const std::string& backend,
                const wait_options& options) -> result<job_handle> {
        if (backend.empty()) {
            return unexpected{error{error_code::invalid_argument, "Backend name is required"}};
        }
        if (payload.empty()) {
            return unexpected{error{error_code::invalid_payload, "Payload is empty"}};
        }

        notify({}, orchestrator_state::submitting);

        if (auto connected = ensure_connected(); !connected) {
            return unexpected{connected.error()};
        }

        auto mode = resolve_mode(payload, options);
        if (!mode) {
            return unexpected{mode.error()};
        }

        auto canonical = payload_codec::canonicalize(payload);

        job_submission submission;
        submission.backend = backend;
        submission.name = options.name;
        if (mode.value() == submission_mode::object_storage) {
            submission.object_storage = true;
        } else {
            submission.inline_payload = payload_codec::to_string(canonical);
        }

        auto submitted = api->submit_job(submission);
        if (!submitted) {
            return unexpected{submitted.error()};
        }

        job_handle handle(submitted.value().id, submitted.value().backend, mode.value());

        if (handle.uses_object_storage()) {
            auto uploaded = transfer.upload(job_context{handle.id(), handle.backend()}, canonical);
            if (!uploaded) {
                job_log_context ctx;
                ctx.job_id = handle.id();
                ctx.backend = handle.backend();
                ctx.error_message = uploaded.error().message;
                JW_LOG_ERROR_CTX(log_category::client, "Payload upload failed", ctx);

                if (auto cancelled = api->cancel_job(handle.id()); !cancelled) {
                    ctx.error_message = cancelled.error().message;
                    JW_LOG_WARN_CTX(log_category::client,
                        "Could not cancel job after failed upload", ctx);
                }
                return unexpected{uploaded.error()};
            }
        }

        job_log_context ctx;
        ctx.job_id = handle.id();
        ctx.backend = handle.backend();
        ctx.bytes = canonical.size();
        JW_LOG_INFO_CTX(log_category::client,
            std::string("Job submitted (") + to_string(handle.mode()) + ")", ctx);
        return handle;
    }

    auto wait(const job_handle& handle, const deadline& until, const wait_options& options)
        -> result<job_outcome> {
        const auto started = std::chrono::steady_clock::now();
        notify(handle.id(), orchestrator_state::awaiting_status);

        job_log_context ctx;
        ctx.job_id = handle.id();
        ctx.backend = handle.backend();

        std::optional<status_event> final_event;
        std::optional<error> fallback_reason;
        monitor_path monitored_by = monitor_path::stream;

        if (config.stream_url.empty()) {
            fallback_reason = error{error_code::connect_failed, "No stream URL configured"};
        } else {
            notify(handle.id(), orchestrator_state::streaming);
            auto streamed = stream.wait_for_final_status(handle, until, options.cancel,
                                                         options.on_status);
            if (streamed) {
                final_event = std::move(streamed.value());
            } else if (is_fallback_eligible(streamed.error().code)) {
                fallback_reason = streamed.error();
            } else {
                ctx.error_message = streamed.error().message;
                JW_LOG_WARN_CTX(log_category::client, "Status wait ended", ctx);
                return unexpected{streamed.error()};
            }
        }

        if (!final_event) {
            ctx.error_message = fallback_reason->message;
            JW_LOG_WARN_CTX(log_category::client, "Falling back to status polling", ctx);
            ctx.error_message.reset();

            monitored_by = monitor_path::polling;
            notify(handle.id(), orchestrator_state::polling);
            auto polled = poller.poll_until_final(handle, until, options.cancel,
                                                  options.on_status);
            if (!polled) {
                ctx.error_message = polled.error().message;
                JW_LOG_WARN_CTX(log_category::client, "Status wait ended", ctx);
                return unexpected{polled.error()};
            }
            final_event = std::move(polled.value());
        }

        notify(handle.id(), orchestrator_state::terminal);

        job_outcome outcome{handle, final_event->status, std::nullopt,
                            monitored_by, std::move(fallback_reason)};

        if (outcome.final_status == job_status::completed) {
            notify(handle.id(), orchestrator_state::fetching_result);
            auto fetched = fetch_result(handle);
            if (!fetched) {
                return unexpected{fetched.error()};
            }
            outcome.result = std::move(fetched.value());
            ctx.bytes = outcome.result->size();
        }

        notify(handle.id(), orchestrator_state::done);

        ctx.status = to_string(outcome.final_status);
        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count());
        JW_LOG_INFO_CTX(log_category::client,
            std::string("Job finished (") + to_string(monitored_by) + ")", ctx);
        return outcome;
    }

    auto submit_and_wait(const std::vector<uint8_t>& payload,
                         const std::string& backend,
                         std::chrono::milliseconds timeout,
                         const wait_options& options) -> result<job_outcome> {
        auto until = deadline::after(timeout);
        auto handle = submit(payload, backend, options);
        if (!handle) {
            return unexpected{handle.error()};
        }
        return wait(handle.value(), until, options);
    }

    auto fetch_result(const job_handle& handle) -> result<std::vector<uint8_t>> {
        if (handle.uses_object_storage()) {
            return transfer.download(handle.id(), object_kind::result);
        }
        return api->job_result(handle.id());
    }

    auto download_job_payload(const job_handle& handle) -> result<std::vector<uint8_t>> {
        if (handle.uses_object_storage()) {
            return transfer.download(handle.id(), object_kind::payload);
        }

        auto doc = api->get_job(handle.id(), field_filter{{"payload"}, {}});
        if (!doc) {
            return unexpected{doc.error()};
        }
        auto it = doc.value().find("payload");
        if (it == doc.value().end()) {
            return unexpected{error{error_code::api_invalid_response,
                "Job " + handle.id() + " has no inline payload"}};
        }
        return payload_codec::to_bytes(it->dump());
    }
};

// ============================================================================
// Builder
// ============================================================================

job_client::builder::builder() = default;

auto job_client::builder::with_config(client_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto job_client::builder::with_http_client(std::shared_ptr<http_client_interface> http)
    -> builder& {
    http_ = std::move(http);
    return *this;
}

auto job_client::builder::with_channel_factory(std::shared_ptr<channel_factory> factory)
    -> builder& {
    factory_ = std::move(factory);
    return *this;
}

auto job_client::builder::build() -> result<job_client> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto http = http_ ? http_ : make_http_client(config_.request_timeout);
    auto factory = factory_ ? factory_
                            : std::make_shared<websocket_channel_factory>(config_.connect_timeout);

    return job_client{config_, std::move(http), std::move(factory)};
}

// ============================================================================
// job_client
// ============================================================================

job_client::job_client(client_config config,
                       std::shared_ptr<http_client_interface> http,
                       std::shared_ptr<channel_factory> factory) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    std::shared_ptr<control_api_client> api = control_api_client::create(config, http);
    impl_ = std::make_shared<impl>(std::move(config), std::move(api),
                                   std::move(http), std::move(factory));
}

job_client::job_client(job_client&&) noexcept = default;
auto job_client::operator=(job_client&&) noexcept -> job_client& = default;
job_client::~job_client() = default;

auto job_client::connect() -> result<void> {
    return impl_->api->connect();
}

auto job_client::is_connected() const -> bool {
    return impl_->api->is_connected();
}

auto job_client::submit(const std::vector<uint8_t>& payload,
                        const std::string& backend,
                        const wait_options& options) -> result<job_handle> {
    return impl_->submit(payload, backend, options);
}

auto job_client::wait(const job_handle& handle,
                      std::chrono::milliseconds timeout,
                      const wait_options& options) -> result<job_outcome> {
    return impl_->wait(handle, deadline::after(timeout), options);
}

auto job_client::submit_and_wait(const std::vector<uint8_t>& payload,
                                 const std::string& backend,
                                 std::chrono::milliseconds timeout,
                                 const wait_options& options) -> result<job_outcome> {
    return impl_->submit_and_wait(payload, backend, timeout, options);
}

auto job_client::submit_and_wait(const std::vector<uint8_t>& payload,
                                 const std::string& backend) -> result<job_outcome> {
    return impl_->submit_and_wait(payload, backend, impl_->config.default_wait_timeout, {});
}

auto job_client::submit_and_wait_async(std::vector<uint8_t> payload,
                                       std::string backend,
                                       std::chrono::milliseconds timeout,
                                       wait_options options)
    -> std::future<result<job_outcome>> {
    return std::async(std::launch::async,
        [state = impl_, payload = std::move(payload), backend = std::move(backend),
         timeout, options = std::move(options)]() {
            return state->submit_and_wait(payload, backend, timeout, options);
        });
}

auto job_client::fetch_result(const job_handle& handle) -> result<std::vector<uint8_t>> {
    return impl_->fetch_result(handle);
}

auto job_client::download_job_payload(const job_handle& handle)
    -> result<std::vector<uint8_t>> {
    return impl_->download_job_payload(handle);
}

auto job_client::cancel_job(const job_handle& handle) -> result<void> {
    return impl_->api->cancel_job(handle.id());
}

void job_client::on_state_changed(state_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->state_changed = std::move(callback);
}

auto job_client::api() -> control_api_client& {
    return *impl_->api;
}

auto job_client::config() const -> const client_config& {
    return impl_->config;
}

}  // namespace jobwire
