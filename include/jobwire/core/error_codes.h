/**
 * @file error_codes.h
 * @brief Error codes for jobwire (-100 to -229 range)
 * @version 0.1.0
 *
 * This file defines all error codes used by the job submission and
 * monitoring layers, grouped into the categories callers branch on.
 */

#ifndef JOBWIRE_CORE_ERROR_CODES_H
#define JOBWIRE_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace jobwire {

/**
 * @brief Error codes for job operations
 *
 * Error code ranges:
 * - -100 to -119: Connect Errors (control or stream connection)
 * - -120 to -139: API Errors (non-2xx control-plane responses)
 * - -140 to -159: Protocol Errors (stream frames, premature close)
 * - -160 to -179: Timeout Errors
 * - -180 to -199: Transfer Errors (object storage PUT/GET, locators)
 * - -200 to -209: Cancellation
 * - -210 to -229: Usage and Internal Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Connect Errors (-100 to -119)
    connect_failed = -100,
    malformed_url = -101,
    host_unreachable = -102,
    auth_rejected = -103,
    missing_credential = -104,
    network_unavailable = -105,

    // API Errors (-120 to -139)
    api_error = -120,
    api_invalid_response = -121,

    // Protocol Errors (-140 to -159)
    protocol_error = -140,
    channel_closed = -141,

    // Timeout Errors (-160 to -179)
    timeout = -160,
    channel_timeout = -161,

    // Transfer Errors (-180 to -199)
    transfer_failed = -180,
    locator_consumed = -181,
    locator_expired = -182,

    // Cancellation (-200 to -209)
    cancelled = -200,

    // Usage and Internal Errors (-210 to -229)
    invalid_argument = -210,
    invalid_payload = -211,
    invalid_configuration = -212,
    internal_error = -213,
    not_connected = -214,
};

/**
 * @brief Error categories surfaced to callers
 */
enum class error_category {
    none,
    connect,
    api,
    protocol,
    timeout,
    transfer,
    cancelled,
    usage
};

/**
 * @brief Convert error_code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";

        // Connect Errors
        case error_code::connect_failed:
            return "connection failed";
        case error_code::malformed_url:
            return "malformed URL";
        case error_code::host_unreachable:
            return "host unreachable";
        case error_code::auth_rejected:
            return "authentication rejected";
        case error_code::missing_credential:
            return "missing credential";
        case error_code::network_unavailable:
            return "network layer not available";

        // API Errors
        case error_code::api_error:
            return "API request failed";
        case error_code::api_invalid_response:
            return "API response could not be decoded";

        // Protocol Errors
        case error_code::protocol_error:
            return "stream protocol error";
        case error_code::channel_closed:
            return "channel closed";

        // Timeout Errors
        case error_code::timeout:
            return "deadline exceeded";
        case error_code::channel_timeout:
            return "channel receive timeout";

        // Transfer Errors
        case error_code::transfer_failed:
            return "object storage transfer failed";
        case error_code::locator_consumed:
            return "storage locator already used";
        case error_code::locator_expired:
            return "storage locator expired";

        // Cancellation
        case error_code::cancelled:
            return "cancelled by caller";

        // Usage and Internal Errors
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_payload:
            return "invalid payload";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_connected:
            return "not connected";

        default:
            return "unknown error";
    }
}

/**
 * @brief Convert error_category to string
 */
[[nodiscard]] constexpr auto to_string(error_category category) noexcept -> std::string_view {
    switch (category) {
        case error_category::none: return "none";
        case error_category::connect: return "ConnectError";
        case error_category::api: return "ApiError";
        case error_category::protocol: return "ProtocolError";
        case error_category::timeout: return "TimeoutError";
        case error_category::transfer: return "TransferError";
        case error_category::cancelled: return "Cancelled";
        case error_category::usage: return "UsageError";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_connect_error(int32_t code) noexcept -> bool {
    return code <= -100 && code >= -119;
}

[[nodiscard]] constexpr auto is_api_error(int32_t code) noexcept -> bool {
    return code <= -120 && code >= -139;
}

[[nodiscard]] constexpr auto is_protocol_error(int32_t code) noexcept -> bool {
    return code <= -140 && code >= -159;
}

[[nodiscard]] constexpr auto is_timeout_error(int32_t code) noexcept -> bool {
    return code <= -160 && code >= -179;
}

[[nodiscard]] constexpr auto is_transfer_error(int32_t code) noexcept -> bool {
    return code <= -180 && code >= -199;
}

[[nodiscard]] constexpr auto is_cancelled(int32_t code) noexcept -> bool {
    return code <= -200 && code >= -209;
}

/**
 * @brief Map an error code to the category callers branch on
 */
[[nodiscard]] constexpr auto category_of(error_code code) noexcept -> error_category {
    const auto value = static_cast<int32_t>(code);
    if (value == 0) return error_category::none;
    if (is_connect_error(value)) return error_category::connect;
    if (is_api_error(value)) return error_category::api;
    if (is_protocol_error(value)) return error_category::protocol;
    if (is_timeout_error(value)) return error_category::timeout;
    if (is_transfer_error(value)) return error_category::transfer;
    if (is_cancelled(value)) return error_category::cancelled;
    return error_category::usage;
}

/**
 * @brief Check if a streaming failure may be recovered by REST polling
 *
 * Only connect and protocol failures qualify. A timeout means the shared
 * budget is spent, and cancellation is the caller's decision.
 */
[[nodiscard]] constexpr auto is_fallback_eligible(error_code code) noexcept -> bool {
    const auto category = category_of(code);
    return category == error_category::connect || category == error_category::protocol;
}

}  // namespace jobwire

#endif  // JOBWIRE_CORE_ERROR_CODES_H
