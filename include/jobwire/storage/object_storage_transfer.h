/**
 * @file object_storage_transfer.h
 * @brief Payload and result staging through object storage
 * @version 0.1.0
 *
 * Upload flow:   request_upload_locator -> put_payload -> signal_upload_complete
 * Download flow: request_download_locator -> get_payload [-> result_downloaded]
 *
 * Locators are requested fresh for every transfer and never retried. A
 * failed transfer is returned to the caller, who must request a new
 * locator to try again.
 */

#ifndef JOBWIRE_STORAGE_OBJECT_STORAGE_TRANSFER_H
#define JOBWIRE_STORAGE_OBJECT_STORAGE_TRANSFER_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "jobwire/api/control_api_client.h"
#include "jobwire/core/types.h"
#include "jobwire/http/http_client.h"
#include "jobwire/storage/storage_locator.h"

namespace jobwire {

/**
 * @brief Job the transfer belongs to
 */
struct job_context {
    std::string job_id;
    std::string backend;
};

/**
 * @brief Object storage transfer for job payloads and results
 */
class object_storage_transfer {
public:
    /**
     * @param api Control API client used for locator and signal calls
     * @param http HTTP client used for the locator URLs themselves
     * @param default_ttl Expiry assumed for locators without one
     */
    object_storage_transfer(std::shared_ptr<control_api_client> api,
                            std::shared_ptr<http_client_interface> http,
                            std::chrono::seconds default_ttl = std::chrono::seconds{300});

    ~object_storage_transfer();

    object_storage_transfer(const object_storage_transfer&) = delete;
    auto operator=(const object_storage_transfer&) -> object_storage_transfer& = delete;
    object_storage_transfer(object_storage_transfer&&) noexcept;
    auto operator=(object_storage_transfer&&) noexcept -> object_storage_transfer&;

    // ========================================================================
    // Single steps
    // ========================================================================

    /**
     * @brief GET /jobs/{id}/jobUploadUrl
     */
    [[nodiscard]] auto request_upload_locator(const job_context& job) -> result<storage_locator>;

    /**
     * @brief PUT @p bytes to an upload locator
     *
     * Claims the locator first, so a second call with the same locator fails
     * with error_code::locator_consumed. Non-2xx or no response is
     * error_code::transfer_failed.
     */
    [[nodiscard]] auto put_payload(const storage_locator& locator,
                                   const std::vector<uint8_t>& bytes) -> result<void>;

    /**
     * @brief POST /jobs/{id}/jobDataUploaded
     */
    [[nodiscard]] auto signal_upload_complete(const job_context& job) -> result<void>;

    /**
     * @brief GET /jobs/{id}/jobDownloadUrl or /jobs/{id}/resultDownloadUrl
     */
    [[nodiscard]] auto request_download_locator(const std::string& job_id, object_kind kind)
        -> result<storage_locator>;

    /**
     * @brief GET the body behind a download locator
     */
    [[nodiscard]] auto get_payload(const storage_locator& locator)
        -> result<std::vector<uint8_t>>;

    // ========================================================================
    // Composite flows
    // ========================================================================

    /**
     * @brief Full upload flow with a freshly requested locator
     */
    [[nodiscard]] auto upload(const job_context& job, const std::vector<uint8_t>& bytes)
        -> result<void>;

    /**
     * @brief Full download flow with a freshly requested locator
     *
     * For results, the service is told the result was downloaded.
     */
    [[nodiscard]] auto download(const std::string& job_id, object_kind kind)
        -> result<std::vector<uint8_t>>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace jobwire

#endif  // JOBWIRE_STORAGE_OBJECT_STORAGE_TRANSFER_H
