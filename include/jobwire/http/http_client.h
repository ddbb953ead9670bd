/**
 * @file http_client.h
 * @brief HTTP client abstraction used by the control API and object storage
 * @version 0.1.0
 *
 * network_http_client wraps the network_system HTTP client. Components take
 * an http_client_interface so tests can substitute an in-process service.
 */

#ifndef JOBWIRE_HTTP_HTTP_CLIENT_H
#define JOBWIRE_HTTP_HTTP_CLIENT_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "jobwire/core/types.h"

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace jobwire {

/**
 * @brief HTTP response
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        auto lower_key = lower(key);
        for (const auto& [name, value] : headers) {
            if (lower(name) == lower_key) {
                return value;
            }
        }
        return std::nullopt;
    }
};

using http_headers = std::map<std::string, std::string>;
using http_query = std::map<std::string, std::string>;

/**
 * @brief HTTP client interface
 *
 * A failed result means no response was received (DNS failure, refused
 * connection, I/O timeout). Any received response, including 4xx and 5xx,
 * is returned as a value.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    [[nodiscard]] virtual auto get(
        const std::string& url,
        const http_query& query,
        const http_headers& headers) -> result<http_response> = 0;

    [[nodiscard]] virtual auto post(
        const std::string& url,
        const std::string& body,
        const http_headers& headers) -> result<http_response> = 0;

    [[nodiscard]] virtual auto put(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const http_headers& headers) -> result<http_response> = 0;

    [[nodiscard]] virtual auto del(
        const std::string& url,
        const http_headers& headers) -> result<http_response> = 0;
};

/**
 * @brief http_client_interface over network_system
 *
 * Without KCENON_WITH_NETWORK_SYSTEM every request fails with
 * error_code::network_unavailable.
 *
 * @note This client is thread-safe for concurrent operations.
 */
class network_http_client : public http_client_interface {
public:
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;
    network_http_client(network_http_client&&) noexcept;
    auto operator=(network_http_client&&) noexcept -> network_http_client&;

    [[nodiscard]] auto get(
        const std::string& url,
        const http_query& query,
        const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::string& body,
        const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto put(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto del(
        const std::string& url,
        const http_headers& headers) -> result<http_response> override;

    /**
     * @brief Check if the network system is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create the default HTTP client
 */
[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_client_interface>;

}  // namespace jobwire

#endif  // JOBWIRE_HTTP_HTTP_CLIENT_H
