/**
 * @file object_storage_transfer.cpp
 * @brief Object storage transfer implementation
 */

#include "jobwire/storage/object_storage_transfer.h"

#include "jobwire/core/logging.h"

namespace jobwire {

// ============================================================================
// Implementation
// ============================================================================

struct object_storage_transfer::impl {
    std::shared_ptr<control_api_client> api_;
    std::shared_ptr<http_client_interface> http_;
    std::chrono::seconds default_ttl_;

    impl(std::shared_ptr<control_api_client> api,
         std::shared_ptr<http_client_interface> http,
         std::chrono::seconds default_ttl)
        : api_(std::move(api)), http_(std::move(http)), default_ttl_(default_ttl) {}

    static auto check_direction(const storage_locator& locator, locator_direction expected)
        -> result<void> {
        if (locator.direction() != expected) {
            return unexpected{error{error_code::invalid_argument,
                std::string("Expected an ") + to_string(expected) + " locator, got " +
                to_string(locator.direction())}};
        }
        return {};
    }

    static auto transfer_error(const char* method, const storage_locator& locator,
                               const std::string& reason) -> unexpected {
        job_log_context ctx;
        ctx.endpoint = locator.url();
        ctx.error_message = reason;
        JW_LOG_ERROR_CTX(log_category::storage,
            std::string("Object storage ") + method + " failed", ctx);
        return unexpected{error{error_code::transfer_failed,
            std::string("Object storage ") + method + " failed: " + reason}};
    }
};

// ============================================================================
// Construction
// ============================================================================

object_storage_transfer::object_storage_transfer(
    std::shared_ptr<control_api_client> api,
    std::shared_ptr<http_client_interface> http,
    std::chrono::seconds default_ttl)
    : impl_(std::make_unique<impl>(std::move(api), std::move(http), default_ttl)) {}

object_storage_transfer::~object_storage_transfer() = default;

object_storage_transfer::object_storage_transfer(object_storage_transfer&&) noexcept = default;
auto object_storage_transfer::operator=(object_storage_transfer&&) noexcept
    -> object_storage_transfer& = default;

// ============================================================================
// Single steps
// ============================================================================

auto object_storage_transfer::request_upload_locator(const job_context& job)
    -> result<storage_locator> {
    auto doc = impl_->api_->job_upload_url(job.job_id);
    if (!doc) {
        return unexpected{doc.error()};
    }
    return storage_locator::from_json(locator_direction::upload, doc.value(),
                                      impl_->default_ttl_);
}

auto object_storage_transfer::put_payload(const storage_locator& locator,
                                          const std::vector<uint8_t>& bytes)
    -> result<void> {
    if (auto checked = impl::check_direction(locator, locator_direction::upload); !checked) {
        return checked;
    }
    if (auto claimed = locator.claim(); !claimed) {
        return claimed;
    }

    http_headers headers{{"Content-Type", "application/octet-stream"}};
    auto response = impl_->http_->put(locator.url(), bytes, headers);
    if (!response) {
        return impl::transfer_error("upload", locator, response.error().message);
    }
    if (!response.value().is_success()) {
        return impl::transfer_error("upload", locator,
            "HTTP " + std::to_string(response.value().status_code));
    }

    job_log_context ctx;
    ctx.endpoint = locator.url();
    ctx.bytes = bytes.size();
    JW_LOG_DEBUG_CTX(log_category::storage, "Payload uploaded", ctx);
    return {};
}

auto object_storage_transfer::signal_upload_complete(const job_context& job) -> result<void> {
    return impl_->api_->job_data_uploaded(job.job_id);
}

auto object_storage_transfer::request_download_locator(const std::string& job_id,
                                                       object_kind kind)
    -> result<storage_locator> {
    auto doc = kind == object_kind::result
        ? impl_->api_->result_download_url(job_id)
        : impl_->api_->job_download_url(job_id);
    if (!doc) {
        return unexpected{doc.error()};
    }
    return storage_locator::from_json(locator_direction::download, doc.value(),
                                      impl_->default_ttl_);
}

auto object_storage_transfer::get_payload(const storage_locator& locator)
    -> result<std::vector<uint8_t>> {
    if (auto checked = impl::check_direction(locator, locator_direction::download); !checked) {
        return unexpected{checked.error()};
    }
    if (auto claimed = locator.claim(); !claimed) {
        return unexpected{claimed.error()};
    }

    auto response = impl_->http_->get(locator.url(), {}, {});
    if (!response) {
        return impl::transfer_error("download", locator, response.error().message);
    }
    if (!response.value().is_success()) {
        return impl::transfer_error("download", locator,
            "HTTP " + std::to_string(response.value().status_code));
    }

    job_log_context ctx;
    ctx.endpoint = locator.url();
    ctx.bytes = response.value().body.size();
    JW_LOG_DEBUG_CTX(log_category::storage, "Object downloaded", ctx);
    return std::move(response.value().body);
}

// ============================================================================
// Composite flows
// ============================================================================

auto object_storage_transfer::upload(const job_context& job,
                                     const std::vector<uint8_t>& bytes) -> result<void> {
    auto locator = request_upload_locator(job);
    if (!locator) {
        return unexpected{locator.error()};
    }
    if (auto put = put_payload(locator.value(), bytes); !put) {
        return put;
    }
    return signal_upload_complete(job);
}

auto object_storage_transfer::download(const std::string& job_id, object_kind kind)
    -> result<std::vector<uint8_t>> {
    auto locator = request_download_locator(job_id, kind);
    if (!locator) {
        return unexpected{locator.error()};
    }
    auto bytes = get_payload(locator.value());
    if (!bytes) {
        return bytes;
    }
    if (kind == object_kind::result) {
        if (auto signalled = impl_->api_->result_downloaded(job_id); !signalled) {
            return unexpected{signalled.error()};
        }
    }
    return bytes;
}

}  // namespace jobwire
