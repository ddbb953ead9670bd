/**
 * @file control_api_client.h
 * @brief REST client for the job service control API
 * @version 0.1.0
 *
 * Thin typed wrappers over the control API endpoints. Every request carries
 * the bearer credential and the client identification header taken from the
 * client_config the instance was created with.
 *
 * @code
 * auto api = control_api_client::create(config, make_http_client());
 * if (auto connected = api->connect(); !connected) {
 *     // connect category error: malformed_url, host_unreachable, auth_rejected...
 * }
 * auto status = api->job_status(job_id);
 * @endcode
 */

#ifndef JOBWIRE_API_CONTROL_API_CLIENT_H
#define JOBWIRE_API_CONTROL_API_CLIENT_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "jobwire/config/client_config.h"
#include "jobwire/core/job_types.h"
#include "jobwire/core/types.h"
#include "jobwire/http/http_client.h"

namespace jobwire {

/**
 * @brief Field selection for get_job
 */
struct field_filter {
    /// Keep only these fields (empty means keep all)
    std::vector<std::string> include;

    /// Remove these fields
    std::vector<std::string> exclude;

    [[nodiscard]] auto empty() const -> bool {
        return include.empty() && exclude.empty();
    }
};

/**
 * @brief Apply include/exclude selection to a job document
 *
 * Include keeps the named top-level fields that exist; when none exist the
 * result is an empty object. Exclude then removes named fields. Unknown
 * names are ignored. Non-object documents are returned unchanged.
 */
[[nodiscard]] auto apply_field_filter(const nlohmann::json& document,
                                      const field_filter& filter) -> nlohmann::json;

/**
 * @brief Submission request
 */
struct job_submission {
    std::string backend;

    /// Canonical JSON payload for inline submission
    std::optional<std::string> inline_payload;

    /// Ask the service to accept the payload through object storage
    bool object_storage = false;

    /// Optional job name
    std::optional<std::string> name;
};

/**
 * @brief Service response to a submission
 */
struct submitted_job {
    std::string id;
    std::string backend;
    std::optional<job_status> status;
};

/**
 * @brief Control API client
 *
 * @note Safe for concurrent use; requests share no mutable state other
 *       than the connected flag.
 */
class control_api_client {
public:
    /**
     * @brief Create a client
     * @param config Client configuration (copied)
     * @param http HTTP client used for all requests
     * @return Client, or nullptr when @p http is null
     */
    [[nodiscard]] static auto create(
        const client_config& config,
        std::shared_ptr<http_client_interface> http) -> std::unique_ptr<control_api_client>;

    ~control_api_client();

    control_api_client(const control_api_client&) = delete;
    auto operator=(const control_api_client&) -> control_api_client& = delete;
    control_api_client(control_api_client&&) noexcept;
    auto operator=(control_api_client&&) noexcept -> control_api_client&;

    // ========================================================================
    // Connection
    // ========================================================================

    /**
     * @brief Verify URL, reachability and credential
     *
     * Issues GET /version and GET /users/me. Failures map to connect
     * category codes: missing_credential, malformed_url, host_unreachable,
     * connect_failed (endpoint not found or unexpected status) and
     * auth_rejected (401/403).
     */
    [[nodiscard]] auto connect() -> result<void>;

    [[nodiscard]] auto is_connected() const -> bool;

    [[nodiscard]] auto config() const -> const client_config&;

    // ========================================================================
    // Jobs
    // ========================================================================

    /**
     * @brief POST /jobs
     */
    [[nodiscard]] auto submit_job(const job_submission& submission) -> result<submitted_job>;

    /**
     * @brief GET /jobs/{id} with optional field selection
     *
     * The selection is sent as include/exclude query parameters and also
     * applied to the returned document.
     */
    [[nodiscard]] auto get_job(const std::string& job_id,
                               const field_filter& filter = {}) -> result<nlohmann::json>;

    /**
     * @brief GET /jobs/{id}/status
     */
    [[nodiscard]] auto job_status(const std::string& job_id) -> result<status_event>;

    /**
     * @brief GET /jobs/{id}/result, returning the body bytes unchanged
     */
    [[nodiscard]] auto job_result(const std::string& job_id) -> result<std::vector<uint8_t>>;

    /**
     * @brief POST /jobs/{id}/cancel
     */
    [[nodiscard]] auto cancel_job(const std::string& job_id) -> result<void>;

    /**
     * @brief GET /jobs/status?limit=&skip=
     */
    [[nodiscard]] auto list_jobs_status(std::size_t limit = 10, std::size_t skip = 0)
        -> result<nlohmann::json>;

    // ========================================================================
    // Object storage endpoints
    // ========================================================================

    [[nodiscard]] auto job_upload_url(const std::string& job_id) -> result<nlohmann::json>;
    [[nodiscard]] auto job_data_uploaded(const std::string& job_id) -> result<void>;
    [[nodiscard]] auto job_download_url(const std::string& job_id) -> result<nlohmann::json>;
    [[nodiscard]] auto result_download_url(const std::string& job_id) -> result<nlohmann::json>;
    [[nodiscard]] auto result_downloaded(const std::string& job_id) -> result<void>;

    // ========================================================================
    // Backends and service info
    // ========================================================================

    [[nodiscard]] auto list_backends() -> result<nlohmann::json>;
    [[nodiscard]] auto backend_status(const std::string& backend) -> result<nlohmann::json>;
    [[nodiscard]] auto backend_properties(const std::string& backend) -> result<nlohmann::json>;
    /**
     * @brief GET /version
     *
     * A plain-text answer is returned as {"version": "<text>"}.
     */
    [[nodiscard]] auto api_version() -> result<nlohmann::json>;

private:
    control_api_client(const client_config& config, std::shared_ptr<http_client_interface> http);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace jobwire

#endif  // JOBWIRE_API_CONTROL_API_CLIENT_H
