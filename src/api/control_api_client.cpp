/**
 * @file control_api_client.cpp
 * @brief Control API client implementation
 */

#include "jobwire/api/control_api_client.h"

#include <algorithm>
#include <atomic>
#include <chrono>

#include "jobwire/core/logging.h"
#include "jobwire/http/http_utils.h"

namespace jobwire {

using json = nlohmann::json;

namespace {

constexpr std::size_t max_error_body_in_message = 256;

auto join_names(const std::vector<std::string>& names) -> std::string {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += name;
    }
    return joined;
}

auto scalar_to_string(const json& value) -> std::string {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

/**
 * @brief Render the service error body, keeping code and message verbatim
 */
auto describe_error_body(const std::string& body) -> std::string {
    auto doc = json::parse(body, nullptr, false);
    if (!doc.is_discarded() && doc.is_object() && doc.contains("error")) {
        const auto& err = doc["error"];
        if (err.is_object()) {
            std::string code = err.contains("code") ? scalar_to_string(err["code"]) : "";
            std::string message = err.contains("message") ? scalar_to_string(err["message"]) : "";
            if (!code.empty() && !message.empty()) {
                return code + ": " + message;
            }
            if (!code.empty() || !message.empty()) {
                return code + message;
            }
        } else if (err.is_string()) {
            return err.get<std::string>();
        }
    }
    if (body.size() > max_error_body_in_message) {
        return body.substr(0, max_error_body_in_message) + "...";
    }
    return body;
}

}  // namespace

// ============================================================================
// Field filtering
// ============================================================================

auto apply_field_filter(const json& document, const field_filter& filter) -> json {
    if (!document.is_object() || filter.empty()) {
        return document;
    }

    json selected = json::object();
    if (filter.include.empty()) {
        selected = document;
    } else {
        for (const auto& name : filter.include) {
            auto it = document.find(name);
            if (it != document.end()) {
                selected[name] = *it;
            }
        }
    }

    for (const auto& name : filter.exclude) {
        selected.erase(name);
    }
    return selected;
}

// ============================================================================
// Implementation
// ============================================================================

struct control_api_client::impl {
    client_config config_;
    std::shared_ptr<http_client_interface> http_;
    http_headers headers_;
    std::atomic<bool> connected_{false};

    impl(const client_config& config, std::shared_ptr<http_client_interface> http)
        : config_(config), http_(std::move(http)) {
        headers_["Authorization"] = "Bearer " + config_.credential;
        headers_[client_app_header_name] = config_.client_app_header();
        headers_["Accept"] = "application/json";
    }

    auto url(const std::string& path) const -> std::string {
        return http_utils::join_url(config_.api_url, path);
    }

    static auto job_path(const std::string& job_id, const std::string& suffix = {})
        -> std::string {
        return "/jobs/" + http_utils::url_encode(job_id) + suffix;
    }

    auto log_request(const char* method, const std::string& path,
                     std::chrono::steady_clock::time_point started,
                     const result<http_response>& response) const {
        if (!get_logger().is_enabled(log_level::debug)) {
            return;
        }
        job_log_context ctx;
        ctx.endpoint = std::string(method) + " " + path;
        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count());
        if (response) {
            ctx.status = std::to_string(response.value().status_code);
        } else {
            ctx.error_message = response.error().message;
        }
        JW_LOG_DEBUG_CTX(log_category::api, "Control API request", ctx);
    }

    auto send_get(const std::string& path, const http_query& query = {})
        -> result<http_response> {
        auto started = std::chrono::steady_clock::now();
        auto response = http_->get(url(path), query, headers_);
        log_request("GET", path, started, response);
        return response;
    }

    auto send_post(const std::string& path, const std::string& body)
        -> result<http_response> {
        auto headers = headers_;
        headers["Content-Type"] = "application/json";
        auto started = std::chrono::steady_clock::now();
        auto response = http_->post(url(path), body, headers);
        log_request("POST", path, started, response);
        return response;
    }

    static auto check_status(const char* method, const std::string& path,
                             result<http_response> response) -> result<http_response> {
        if (!response) {
            return response;
        }
        const auto& resp = response.value();
        if (!resp.is_success()) {
            auto message = "HTTP " + std::to_string(resp.status_code) + " on " +
                           method + " " + path + ": " +
                           describe_error_body(resp.get_body_string());
            JW_LOG_WARN(log_category::api, message);
            return unexpected{error{error_code::api_error, message}};
        }
        return response;
    }

    static auto parse_body(const std::string& path, const http_response& resp)
        -> result<json> {
        auto doc = json::parse(resp.get_body_string(), nullptr, false);
        if (doc.is_discarded()) {
            return unexpected{error{error_code::api_invalid_response,
                "Response from " + path + " is not valid JSON"}};
        }
        return doc;
    }

    auto get_json(const std::string& path, const http_query& query = {}) -> result<json> {
        auto response = check_status("GET", path, send_get(path, query));
        if (!response) {
            return unexpected{response.error()};
        }
        return parse_body(path, response.value());
    }

    auto post_json(const std::string& path, const std::string& body = "{}") -> result<json> {
        auto response = check_status("POST", path, send_post(path, body));
        if (!response) {
            return unexpected{response.error()};
        }
        if (response.value().body.empty()) {
            return json::object();
        }
        return parse_body(path, response.value());
    }

    auto post_void(const std::string& path) -> result<void> {
        auto response = check_status("POST", path, send_post(path, "{}"));
        if (!response) {
            return unexpected{response.error()};
        }
        return {};
    }
};

// ============================================================================
// Construction
// ============================================================================

control_api_client::control_api_client(const client_config& config,
                                       std::shared_ptr<http_client_interface> http)
    : impl_(std::make_unique<impl>(config, std::move(http))) {}

control_api_client::~control_api_client() = default;

control_api_client::control_api_client(control_api_client&&) noexcept = default;
auto control_api_client::operator=(control_api_client&&) noexcept
    -> control_api_client& = default;

auto control_api_client::create(
    const client_config& config,
    std::shared_ptr<http_client_interface> http) -> std::unique_ptr<control_api_client> {
    if (!http) {
        return nullptr;
    }
    return std::unique_ptr<control_api_client>(new control_api_client(config, std::move(http)));
}

auto control_api_client::config() const -> const client_config& {
    return impl_->config_;
}

// ============================================================================
// Connection
// ============================================================================

auto control_api_client::connect() -> result<void> {
    const auto& config = impl_->config_;
    if (config.credential.empty()) {
        return unexpected{error{error_code::missing_credential,
            "No credential configured"}};
    }

    auto parsed = http_utils::parse_url(config.api_url);
    if (!parsed) {
        return unexpected{parsed.error()};
    }
    if (parsed.value().scheme != "http" && parsed.value().scheme != "https") {
        return unexpected{error{error_code::malformed_url,
            "API URL must use http or https: " + config.api_url}};
    }

    auto version = impl_->send_get("/version");
    if (!version) {
        JW_LOG_ERROR(log_category::api,
            "Cannot reach " + config.api_url + ": " + version.error().message);
        return unexpected{version.error()};
    }
    if (version.value().status_code == 404) {
        return unexpected{error{error_code::connect_failed,
            "API endpoint not found: " + config.api_url}};
    }
    if (!version.value().is_success()) {
        return unexpected{error{error_code::connect_failed,
            "Unexpected HTTP " + std::to_string(version.value().status_code) +
            " from " + config.api_url + "/version"}};
    }

    auto user = impl_->send_get("/users/me");
    if (!user) {
        return unexpected{user.error()};
    }
    auto code = user.value().status_code;
    if (code == 401 || code == 403) {
        JW_LOG_ERROR(log_category::api, "Credential rejected by " + config.api_url);
        return unexpected{error{error_code::auth_rejected,
            "Credential rejected (HTTP " + std::to_string(code) + "): " +
            describe_error_body(user.value().get_body_string())}};
    }
    if (!user.value().is_success()) {
        return unexpected{error{error_code::connect_failed,
            "Unexpected HTTP " + std::to_string(code) + " from " +
            config.api_url + "/users/me"}};
    }

    impl_->connected_ = true;
    JW_LOG_INFO(log_category::api, "Connected to " + config.api_url);
    return {};
}

auto control_api_client::is_connected() const -> bool {
    return impl_->connected_.load();
}

// ============================================================================
// Jobs
// ============================================================================

auto control_api_client::submit_job(const job_submission& submission)
    -> result<submitted_job> {
    if (submission.backend.empty()) {
        return unexpected{error{error_code::invalid_argument, "Backend name is required"}};
    }
    if (!submission.object_storage && !submission.inline_payload) {
        return unexpected{error{error_code::invalid_argument,
            "Inline submission requires a payload"}};
    }

    json body;
    body["backend"] = {{"name", submission.backend}};
    if (submission.name) {
        body["name"] = *submission.name;
    }
    if (submission.object_storage) {
        body["allowObjectStorage"] = true;
    } else {
        auto payload = json::parse(*submission.inline_payload, nullptr, false);
        if (payload.is_discarded()) {
            return unexpected{error{error_code::invalid_payload,
                "Inline payload must be a JSON document"}};
        }
        body["payload"] = std::move(payload);
    }

    auto response = impl_->post_json("/jobs", body.dump());
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& doc = response.value();
    if (!doc.is_object() || !doc.contains("id") || !doc["id"].is_string()) {
        return unexpected{error{error_code::api_invalid_response,
            "Submit response has no job id"}};
    }

    submitted_job job;
    job.id = doc["id"].get<std::string>();
    job.backend = submission.backend;
    if (doc.contains("backend")) {
        const auto& backend = doc["backend"];
        if (backend.is_string()) {
            job.backend = backend.get<std::string>();
        } else if (backend.is_object() && backend.contains("name") && backend["name"].is_string()) {
            job.backend = backend["name"].get<std::string>();
        }
    }
    if (doc.contains("status") && doc["status"].is_string()) {
        job.status = parse_job_status(doc["status"].get<std::string>());
    }

    job_log_context ctx;
    ctx.job_id = job.id;
    ctx.backend = job.backend;
    JW_LOG_INFO_CTX(log_category::api, "Job submitted", ctx);
    return job;
}

auto control_api_client::get_job(const std::string& job_id, const field_filter& filter)
    -> result<json> {
    http_query query;
    if (!filter.include.empty()) {
        query["include"] = join_names(filter.include);
    }
    if (!filter.exclude.empty()) {
        query["exclude"] = join_names(filter.exclude);
    }

    auto doc = impl_->get_json(impl::job_path(job_id), query);
    if (!doc) {
        return doc;
    }
    return apply_field_filter(doc.value(), filter);
}

auto control_api_client::job_status(const std::string& job_id) -> result<status_event> {
    auto path = impl::job_path(job_id, "/status");
    auto response = impl::check_status("GET", path, impl_->send_get(path));
    if (!response) {
        return unexpected{response.error()};
    }

    auto raw = response.value().get_body_string();
    auto doc = json::parse(raw, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() ||
        !doc.contains("status") || !doc["status"].is_string()) {
        return unexpected{error{error_code::api_invalid_response,
            "Status response for job " + job_id + " has no status field"}};
    }

    auto name = doc["status"].get<std::string>();
    auto status = parse_job_status(name);
    if (!status) {
        return unexpected{error{error_code::api_invalid_response,
            "Unknown job status '" + name + "'"}};
    }
    return status_event{job_id, *status, std::move(raw)};
}

auto control_api_client::job_result(const std::string& job_id)
    -> result<std::vector<uint8_t>> {
    auto path = impl::job_path(job_id, "/result");
    auto response = impl::check_status("GET", path, impl_->send_get(path));
    if (!response) {
        return unexpected{response.error()};
    }
    return std::move(response.value().body);
}

auto control_api_client::cancel_job(const std::string& job_id) -> result<void> {
    return impl_->post_void(impl::job_path(job_id, "/cancel"));
}

auto control_api_client::list_jobs_status(std::size_t limit, std::size_t skip)
    -> result<json> {
    http_query query{
        {"limit", std::to_string(limit)},
        {"skip", std::to_string(skip)}
    };
    return impl_->get_json("/jobs/status", query);
}

// ============================================================================
// Object storage endpoints
// ============================================================================

auto control_api_client::job_upload_url(const std::string& job_id) -> result<json> {
    return impl_->get_json(impl::job_path(job_id, "/jobUploadUrl"));
}

auto control_api_client::job_data_uploaded(const std::string& job_id) -> result<void> {
    return impl_->post_void(impl::job_path(job_id, "/jobDataUploaded"));
}

auto control_api_client::job_download_url(const std::string& job_id) -> result<json> {
    return impl_->get_json(impl::job_path(job_id, "/jobDownloadUrl"));
}

auto control_api_client::result_download_url(const std::string& job_id) -> result<json> {
    return impl_->get_json(impl::job_path(job_id, "/resultDownloadUrl"));
}

auto control_api_client::result_downloaded(const std::string& job_id) -> result<void> {
    return impl_->post_void(impl::job_path(job_id, "/resultDownloaded"));
}

// ============================================================================
// Backends and service info
// ============================================================================

auto control_api_client::list_backends() -> result<json> {
    return impl_->get_json("/Backends");
}

auto control_api_client::backend_status(const std::string& backend) -> result<json> {
    return impl_->get_json("/backends/" + http_utils::url_encode(backend) + "/status");
}

auto control_api_client::backend_properties(const std::string& backend) -> result<json> {
    return impl_->get_json("/backends/" + http_utils::url_encode(backend) + "/properties");
}

auto control_api_client::api_version() -> result<json> {
    auto response = impl::check_status("GET", "/version", impl_->send_get("/version"));
    if (!response) {
        return unexpected{response.error()};
    }

    // Older deployments answer with a bare version string
    auto body = response.value().get_body_string();
    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return json{{"version", body}};
    }
    return doc;
}

}  // namespace jobwire
