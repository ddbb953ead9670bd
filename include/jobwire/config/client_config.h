/**
 * @file client_config.h
 * @brief Client configuration types
 * @version 0.1.0
 *
 * Configuration is an explicit value passed to each client at construction.
 * Nothing here is read lazily from the environment, so clients built from
 * different configurations never observe each other's settings.
 */

#ifndef JOBWIRE_CONFIG_CLIENT_CONFIG_H
#define JOBWIRE_CONFIG_CLIENT_CONFIG_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "jobwire/core/job_types.h"
#include "jobwire/core/types.h"

namespace jobwire {

/**
 * @brief Name of the client identification header
 */
inline constexpr const char* client_app_header_name = "X-Client-Application";

/**
 * @brief Environment variable names read by client_config::from_environment()
 */
struct config_env {
    static constexpr const char* api_url = "JOBWIRE_API_URL";
    static constexpr const char* stream_url = "JOBWIRE_STREAM_URL";
    static constexpr const char* token = "JOBWIRE_TOKEN";
    static constexpr const char* custom_client_app_header = "JOBWIRE_CUSTOM_CLIENT_APP_HEADER";
};

/**
 * @brief Configuration for a job_client and the components it owns
 */
struct client_config {
    /// Control API base URL, e.g. https://api.example.com/api
    std::string api_url;

    /// Streaming status base URL, e.g. wss://stream.example.com
    std::string stream_url;

    /// Bearer credential
    std::string credential;

    /// Appended to the default client identification header when set
    std::optional<std::string> custom_client_app_header;

    /// Control API request timeout
    std::chrono::milliseconds request_timeout{30000};

    /// Stream connection timeout
    std::chrono::milliseconds connect_timeout{10000};

    /// Fixed interval between REST status polls
    std::chrono::milliseconds poll_interval{2000};

    /// Budget used when a caller does not pass one
    std::chrono::milliseconds default_wait_timeout{std::chrono::minutes{10}};

    /// Payload routing policy
    submission_mode mode = submission_mode::automatic;

    /// Payloads larger than this use object storage in automatic mode
    std::size_t object_storage_threshold = 1024 * 1024;

    /// Validity assumed for a locator the service returns without an expiry
    std::chrono::seconds locator_default_ttl{300};

    /**
     * @brief Value of the client identification header for this config
     *
     * "jobwire/<version>" or "jobwire/<version>/<custom>".
     */
    [[nodiscard]] auto client_app_header() const -> std::string;

    /**
     * @brief Check required fields and ranges
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Build a configuration from the current environment
     *
     * Reads the variables in config_env at call time. An unset
     * JOBWIRE_CUSTOM_CLIENT_APP_HEADER leaves the header at its default.
     */
    [[nodiscard]] static auto from_environment() -> client_config;
};

/**
 * @brief Fluent builder for client_config
 *
 * @code
 * auto config = client_config_builder()
 *     .with_api_url("https://api.example.com/api")
 *     .with_stream_url("wss://stream.example.com")
 *     .with_credential(token)
 *     .with_poll_interval(std::chrono::seconds{1})
 *     .build();
 * @endcode
 */
class client_config_builder {
public:
    client_config_builder() = default;

    explicit client_config_builder(client_config base) : config_(std::move(base)) {}

    auto with_api_url(const std::string& url) -> client_config_builder& {
        config_.api_url = url;
        return *this;
    }

    auto with_stream_url(const std::string& url) -> client_config_builder& {
        config_.stream_url = url;
        return *this;
    }

    auto with_credential(const std::string& credential) -> client_config_builder& {
        config_.credential = credential;
        return *this;
    }

    auto with_custom_client_app_header(const std::string& value) -> client_config_builder& {
        config_.custom_client_app_header = value;
        return *this;
    }

    auto without_custom_client_app_header() -> client_config_builder& {
        config_.custom_client_app_header.reset();
        return *this;
    }

    auto with_request_timeout(std::chrono::milliseconds timeout) -> client_config_builder& {
        config_.request_timeout = timeout;
        return *this;
    }

    auto with_connect_timeout(std::chrono::milliseconds timeout) -> client_config_builder& {
        config_.connect_timeout = timeout;
        return *this;
    }

    auto with_poll_interval(std::chrono::milliseconds interval) -> client_config_builder& {
        config_.poll_interval = interval;
        return *this;
    }

    auto with_default_wait_timeout(std::chrono::milliseconds timeout) -> client_config_builder& {
        config_.default_wait_timeout = timeout;
        return *this;
    }

    auto with_submission_mode(submission_mode mode) -> client_config_builder& {
        config_.mode = mode;
        return *this;
    }

    auto with_object_storage_threshold(std::size_t bytes) -> client_config_builder& {
        config_.object_storage_threshold = bytes;
        return *this;
    }

    auto with_locator_default_ttl(std::chrono::seconds ttl) -> client_config_builder& {
        config_.locator_default_ttl = ttl;
        return *this;
    }

    [[nodiscard]] auto build() const -> client_config {
        return config_;
    }

private:
    client_config config_;
};

}  // namespace jobwire

#endif  // JOBWIRE_CONFIG_CLIENT_CONFIG_H
