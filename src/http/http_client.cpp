/**
 * @file http_client.cpp
 * @brief network_system HTTP client adapter
 */

#include "jobwire/http/http_client.h"

#include "jobwire/config/feature_flags.h"
#include "jobwire/core/logging.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace jobwire {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    template <typename NetResult>
    static auto convert(const char* method, const std::string& url, NetResult& response)
        -> result<http_response> {
        if (response.is_err()) {
            JW_LOG_DEBUG(log_category::api,
                std::string("HTTP ") + method + " failed: " + url +
                " (" + response.error().message + ")");
            return unexpected{error{error_code::host_unreachable,
                std::string("HTTP ") + method + " request failed: " +
                response.error().message}};
        }
        return convert_response(response.value());
    }
#endif

    static auto not_available() -> result<http_response> {
        return unexpected{error{error_code::network_unavailable,
            "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

network_http_client::network_http_client(network_http_client&&) noexcept = default;
auto network_http_client::operator=(network_http_client&&) noexcept
    -> network_http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_http_client::get(
    const std::string& url,
    const http_query& query,
    const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->get(url, query, headers);
    return impl::convert("GET", url, response);
#else
    (void)url;
    (void)query;
    (void)headers;
    return impl::not_available();
#endif
}

auto network_http_client::post(
    const std::string& url,
    const std::string& body,
    const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->post(url, body, headers);
    return impl::convert("POST", url, response);
#else
    (void)url;
    (void)body;
    (void)headers;
    return impl::not_available();
#endif
}

auto network_http_client::put(
    const std::string& url,
    const std::vector<uint8_t>& body,
    const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    std::string body_str(body.begin(), body.end());
    auto response = impl_->client->put(url, body_str, headers);
    return impl::convert("PUT", url, response);
#else
    (void)url;
    (void)body;
    (void)headers;
    return impl::not_available();
#endif
}

auto network_http_client::del(
    const std::string& url,
    const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->del(url, headers);
    return impl::convert("DELETE", url, response);
#else
    (void)url;
    (void)headers;
    return impl::not_available();
#endif
}

auto network_http_client::is_available() const noexcept -> bool {
    return impl_ && impl_->available;
}

auto make_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client_interface> {
    return std::make_shared<network_http_client>(timeout);
}

}  // namespace jobwire
