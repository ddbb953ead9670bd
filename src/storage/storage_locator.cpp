/**
 * @file storage_locator.cpp
 * @brief Storage locator implementation
 */

#include "jobwire/storage/storage_locator.h"

#include <charconv>
#include <cmath>
#include <optional>

#include "jobwire/http/http_utils.h"

namespace jobwire {

namespace {

auto invalid(locator_direction direction, const std::string& reason) -> unexpected {
    return unexpected{error{error_code::api_invalid_response,
        std::string("Invalid ") + to_string(direction) + " locator: " + reason}};
}

using locator_time = storage_locator::clock::time_point;

// Largest epoch offset in seconds the clock can represent
constexpr int64_t max_epoch_seconds = std::chrono::duration_cast<std::chrono::seconds>(
    storage_locator::clock::duration::max()).count();

auto from_epoch_seconds(int64_t seconds) -> std::optional<locator_time> {
    if (seconds > max_epoch_seconds || seconds < -max_epoch_seconds) {
        return std::nullopt;
    }
    return locator_time{std::chrono::duration_cast<storage_locator::clock::duration>(
        std::chrono::seconds{seconds})};
}

auto from_epoch_seconds(double seconds) -> std::optional<locator_time> {
    if (!std::isfinite(seconds) || seconds > static_cast<double>(max_epoch_seconds) ||
        seconds < -static_cast<double>(max_epoch_seconds)) {
        return std::nullopt;
    }
    return from_epoch_seconds(static_cast<int64_t>(seconds));
}

}  // namespace

auto storage_locator::from_json(locator_direction direction,
                                const nlohmann::json& document,
                                std::chrono::seconds default_ttl,
                                clock::time_point now) -> result<storage_locator> {
    if (!document.is_object()) {
        return invalid(direction, "response is not an object");
    }

    auto url_it = document.find("url");
    if (url_it == document.end() || !url_it->is_string() ||
        url_it->get<std::string>().empty()) {
        return invalid(direction, "missing url");
    }
    auto url = url_it->get<std::string>();
    if (auto parsed = http_utils::parse_url(url); !parsed) {
        return invalid(direction, parsed.error().message);
    }

    clock::time_point expiry = now + default_ttl;
    auto expiry_it = document.find("expiry");
    if (expiry_it != document.end() && !expiry_it->is_null()) {
        std::optional<locator_time> parsed;
        if (expiry_it->is_number_unsigned()) {
            auto seconds = expiry_it->get<uint64_t>();
            if (seconds <= static_cast<uint64_t>(max_epoch_seconds)) {
                parsed = from_epoch_seconds(static_cast<int64_t>(seconds));
            }
        } else if (expiry_it->is_number_integer()) {
            parsed = from_epoch_seconds(expiry_it->get<int64_t>());
        } else if (expiry_it->is_number()) {
            parsed = from_epoch_seconds(expiry_it->get<double>());
        } else if (expiry_it->is_string()) {
            auto text = expiry_it->get<std::string>();
            int64_t seconds = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
            if (ec == std::errc{} && ptr == text.data() + text.size()) {
                parsed = from_epoch_seconds(seconds);
            } else if (ec == std::errc::result_out_of_range) {
                parsed = std::nullopt;
            } else if (auto iso = http_utils::parse_iso8601(text)) {
                parsed = *iso;
            } else {
                return invalid(direction, "unrecognised expiry '" + text + "'");
            }
        } else {
            return invalid(direction, "unrecognised expiry type");
        }
        if (!parsed) {
            return invalid(direction, "expiry " + expiry_it->dump() + " is out of range");
        }
        expiry = *parsed;
    }

    return storage_locator(direction, std::move(url), expiry);
}

auto storage_locator::claim(clock::time_point now) const -> result<void> {
    if (consumed_->exchange(true)) {
        return unexpected{error{error_code::locator_consumed,
            std::string(to_string(direction_)) + " locator was already used"}};
    }
    if (is_expired(now)) {
        return unexpected{error{error_code::locator_expired,
            std::string(to_string(direction_)) + " locator expired"}};
    }
    return {};
}

}  // namespace jobwire
