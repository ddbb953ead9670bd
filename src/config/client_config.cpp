/**
 * @file client_config.cpp
 * @brief Client configuration implementation
 */

#include "jobwire/config/client_config.h"
#include "jobwire/jobwire.h"

#include <cstdlib>

namespace jobwire {

namespace {

auto read_env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

auto client_config::client_app_header() const -> std::string {
    std::string header = "jobwire/" + version::to_string();
    if (custom_client_app_header && !custom_client_app_header->empty()) {
        header += "/" + *custom_client_app_header;
    }
    return header;
}

auto client_config::validate() const -> result<void> {
    if (api_url.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "api_url is required"}};
    }
    if (poll_interval.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "poll_interval must be positive"}};
    }
    if (request_timeout.count() <= 0 || connect_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "timeouts must be positive"}};
    }
    if (locator_default_ttl.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "locator_default_ttl must be positive"}};
    }
    return {};
}

auto client_config::from_environment() -> client_config {
    client_config config;
    if (auto value = read_env(config_env::api_url)) {
        config.api_url = *value;
    }
    if (auto value = read_env(config_env::stream_url)) {
        config.stream_url = *value;
    }
    if (auto value = read_env(config_env::token)) {
        config.credential = *value;
    }
    config.custom_client_app_header = read_env(config_env::custom_client_app_header);
    return config;
}

}  // namespace jobwire
