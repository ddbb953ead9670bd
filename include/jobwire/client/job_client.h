/**
 * @file job_client.h
 * @brief Job submission orchestrator
 */

#ifndef JOBWIRE_CLIENT_JOB_CLIENT_H
#define JOBWIRE_CLIENT_JOB_CLIENT_H

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "jobwire/api/control_api_client.h"
#include "jobwire/client/client_types.h"
#include "jobwire/config/client_config.h"
#include "jobwire/core/types.h"
#include "jobwire/http/http_client.h"
#include "jobwire/stream/transport_channel.h"

namespace jobwire {

/**
 * @brief Submits jobs and waits for their final status
 *
 * Status is taken from the streaming endpoint first. When the stream cannot
 * be opened, rejects the subscription, sends an undecodable frame or closes
 * early, the remaining budget is spent polling the REST status endpoint.
 * A stream timeout ends the wait.
 *
 * @code
 * auto client_result = job_client::builder()
 *     .with_config(client_config::from_environment())
 *     .build();
 *
 * if (client_result.has_value()) {
 *     auto& client = client_result.value();
 *     auto outcome = client.submit_and_wait(payload, "simulator", std::chrono::minutes{5});
 *     if (outcome && outcome.value().final_status == job_status::completed) {
 *         use(*outcome.value().result);
 *     }
 * }
 * @endcode
 *
 * @note submit_and_wait may be called concurrently; each call owns its
 *       channel and deadline.
 */
class job_client {
public:
    /**
     * @brief Builder for job_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the configuration (required: api_url, credential)
         */
        auto with_config(client_config config) -> builder&;

        /**
         * @brief Use a custom HTTP client (default: network_http_client)
         */
        auto with_http_client(std::shared_ptr<http_client_interface> http) -> builder&;

        /**
         * @brief Use a custom channel factory (default: websocket_channel_factory)
         */
        auto with_channel_factory(std::shared_ptr<channel_factory> factory) -> builder&;

        /**
         * @brief Build the client instance
         * @return Result containing the client or an invalid_configuration error
         */
        [[nodiscard]] auto build() -> result<job_client>;

    private:
        client_config config_;
        std::shared_ptr<http_client_interface> http_;
        std::shared_ptr<channel_factory> factory_;
    };

    // Non-copyable, movable
    job_client(const job_client&) = delete;
    auto operator=(const job_client&) -> job_client& = delete;
    job_client(job_client&&) noexcept;
    auto operator=(job_client&&) noexcept -> job_client&;
    ~job_client();

    /**
     * @brief Verify the API URL and credential
     *
     * Called implicitly by the first submission when not yet connected.
     */
    [[nodiscard]] auto connect() -> result<void>;

    [[nodiscard]] auto is_connected() const -> bool;

    /**
     * @brief Submit a payload without waiting
     */
    [[nodiscard]] auto submit(const std::vector<uint8_t>& payload,
                              const std::string& backend,
                              const wait_options& options = {}) -> result<job_handle>;

    /**
     * @brief Wait for a submitted job and fetch its result
     */
    [[nodiscard]] auto wait(const job_handle& handle,
                            std::chrono::milliseconds timeout,
                            const wait_options& options = {}) -> result<job_outcome>;

    /**
     * @brief Submit a payload, wait for the final status and fetch the result
     * @param payload Job payload; JSON documents are canonicalized
     * @param backend Target backend name
     * @param timeout Budget covering submission and the status wait
     * @param options Cancellation, observer and per-call overrides
     */
    [[nodiscard]] auto submit_and_wait(const std::vector<uint8_t>& payload,
                                       const std::string& backend,
                                       std::chrono::milliseconds timeout,
                                       const wait_options& options = {}) -> result<job_outcome>;

    /**
     * @brief submit_and_wait with client_config::default_wait_timeout
     */
    [[nodiscard]] auto submit_and_wait(const std::vector<uint8_t>& payload,
                                       const std::string& backend) -> result<job_outcome>;

    /**
     * @brief Run submit_and_wait on a separate task
     *
     * The returned future stays valid if this client is moved or destroyed.
     */
    [[nodiscard]] auto submit_and_wait_async(std::vector<uint8_t> payload,
                                             std::string backend,
                                             std::chrono::milliseconds timeout,
                                             wait_options options = {})
        -> std::future<result<job_outcome>>;

    /**
     * @brief Fetch the result of a completed job the way it was submitted
     */
    [[nodiscard]] auto fetch_result(const job_handle& handle) -> result<std::vector<uint8_t>>;

    /**
     * @brief Retrieve the submitted payload back from the service
     */
    [[nodiscard]] auto download_job_payload(const job_handle& handle)
        -> result<std::vector<uint8_t>>;

    /**
     * @brief Ask the service to cancel a job
     */
    [[nodiscard]] auto cancel_job(const job_handle& handle) -> result<void>;

    /**
     * @brief Register a state change callback
     */
    void on_state_changed(state_callback callback);

    /**
     * @brief Control API for the thin wrapper calls (backends, job lists...)
     */
    [[nodiscard]] auto api() -> control_api_client&;

    [[nodiscard]] auto config() const -> const client_config&;

private:
    job_client(client_config config,
               std::shared_ptr<http_client_interface> http,
               std::shared_ptr<channel_factory> factory);

    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace jobwire

#endif  // JOBWIRE_CLIENT_JOB_CLIENT_H
