/**
 * @file storage_locator.h
 * @brief Short-lived, single-use object storage locators
 * @version 0.1.0
 */

#ifndef JOBWIRE_STORAGE_STORAGE_LOCATOR_H
#define JOBWIRE_STORAGE_STORAGE_LOCATOR_H

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "jobwire/core/types.h"

namespace jobwire {

/**
 * @brief Transfer direction a locator was issued for
 */
enum class locator_direction {
    upload,
    download
};

[[nodiscard]] constexpr auto to_string(locator_direction direction) -> const char* {
    switch (direction) {
        case locator_direction::upload: return "upload";
        case locator_direction::download: return "download";
        default: return "unknown";
    }
}

/**
 * @brief Object stored for a job
 */
enum class object_kind {
    payload,  ///< The submitted job payload
    result    ///< The job result
};

[[nodiscard]] constexpr auto to_string(object_kind kind) -> const char* {
    switch (kind) {
        case object_kind::payload: return "payload";
        case object_kind::result: return "result";
        default: return "unknown";
    }
}

/**
 * @brief Pre-signed URL for exactly one transfer
 *
 * Copies share the single-use state: once any copy has been used for a
 * transfer, every copy is consumed.
 */
class storage_locator {
public:
    using clock = std::chrono::system_clock;

    storage_locator(locator_direction direction, std::string url, clock::time_point expiry)
        : direction_(direction),
          url_(std::move(url)),
          expiry_(expiry),
          consumed_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Build a locator from a service response
     *
     * Expects {"url": "...", "expiry": <ISO 8601 string or epoch seconds>}.
     * A missing expiry is replaced by now + @p default_ttl.
     *
     * @return Locator or error_code::api_invalid_response
     */
    [[nodiscard]] static auto from_json(locator_direction direction,
                                        const nlohmann::json& document,
                                        std::chrono::seconds default_ttl,
                                        clock::time_point now = clock::now())
        -> result<storage_locator>;

    [[nodiscard]] auto direction() const noexcept -> locator_direction { return direction_; }
    [[nodiscard]] auto url() const -> const std::string& { return url_; }
    [[nodiscard]] auto expiry() const noexcept -> clock::time_point { return expiry_; }

    [[nodiscard]] auto is_expired(clock::time_point now = clock::now()) const noexcept -> bool {
        return now >= expiry_;
    }

    [[nodiscard]] auto is_consumed() const noexcept -> bool {
        return consumed_->load();
    }

    /**
     * @brief Claim the locator for its one transfer
     *
     * @return error_code::locator_consumed if a transfer was already
     *         attempted, error_code::locator_expired past the expiry.
     */
    [[nodiscard]] auto claim(clock::time_point now = clock::now()) const -> result<void>;

private:
    locator_direction direction_;
    std::string url_;
    clock::time_point expiry_;
    std::shared_ptr<std::atomic<bool>> consumed_;
};

}  // namespace jobwire

#endif  // JOBWIRE_STORAGE_STORAGE_LOCATOR_H
