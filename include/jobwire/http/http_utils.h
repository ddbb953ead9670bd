/**
 * @file http_utils.h
 * @brief URL and timestamp helpers shared by the HTTP and streaming layers
 * @version 0.1.0
 */

#ifndef JOBWIRE_HTTP_HTTP_UTILS_H
#define JOBWIRE_HTTP_HTTP_UTILS_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "jobwire/core/types.h"

namespace jobwire::http_utils {

// ============================================================================
// URL Utilities
// ============================================================================

/**
 * @brief Components of an absolute URL
 */
struct parsed_url {
    std::string scheme;   ///< Lowercase: http, https, ws or wss
    std::string host;
    uint16_t port = 0;    ///< Explicit port or the scheme default
    std::string path;     ///< Always starts with '/'
    std::string query;    ///< Without the leading '?'

    [[nodiscard]] auto is_secure() const -> bool {
        return scheme == "https" || scheme == "wss";
    }
};

/**
 * @brief Parse and validate an absolute URL
 *
 * Accepts the http, https, ws and wss schemes with a non-empty host.
 *
 * @return parsed_url or error_code::malformed_url
 */
[[nodiscard]] auto parse_url(const std::string& url) -> result<parsed_url>;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode '/' characters
 */
[[nodiscard]] auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Build "k1=v1&k2=v2" with encoded keys and values
 */
[[nodiscard]] auto build_query_string(const std::map<std::string, std::string>& query)
    -> std::string;

/**
 * @brief Join a base URL and a path with exactly one '/'
 */
[[nodiscard]] auto join_url(const std::string& base, const std::string& path) -> std::string;

/**
 * @brief Drop the query and fragment from a URL
 */
[[nodiscard]] auto strip_query(const std::string& url) -> std::string;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Parse an ISO 8601 / RFC 3339 UTC timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and a
 * trailing 'Z' or numeric offset.
 */
[[nodiscard]] auto parse_iso8601(const std::string& value)
    -> std::optional<std::chrono::system_clock::time_point>;

}  // namespace jobwire::http_utils

#endif  // JOBWIRE_HTTP_HTTP_UTILS_H
