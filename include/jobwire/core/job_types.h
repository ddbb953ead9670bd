/**
 * @file job_types.h
 * @brief Job identifiers, statuses and status events
 */

#ifndef JOBWIRE_CORE_JOB_TYPES_H
#define JOBWIRE_CORE_JOB_TYPES_H

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace jobwire {

/**
 * @brief Job lifecycle status, shared by the stream and REST paths
 */
enum class job_status {
    queued,
    running,
    completed,
    cancelled,
    error
};

[[nodiscard]] constexpr auto to_string(job_status status) -> const char* {
    switch (status) {
        case job_status::queued: return "QUEUED";
        case job_status::running: return "RUNNING";
        case job_status::completed: return "COMPLETED";
        case job_status::cancelled: return "CANCELLED";
        case job_status::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Check whether no further transition can follow @p status
 */
[[nodiscard]] constexpr auto is_terminal(job_status status) noexcept -> bool {
    return status == job_status::completed ||
           status == job_status::cancelled ||
           status == job_status::error;
}

/**
 * @brief Reconcile a service status name to job_status
 *
 * Accepts the five canonical names plus the service's intermediate states
 * (CREATING, VALIDATED, TRANSPILING, ERROR_RUNNING_JOB, ...). Matching is
 * case-insensitive.
 *
 * @return std::nullopt for names that are not job states
 */
[[nodiscard]] auto parse_job_status(std::string_view name) -> std::optional<job_status>;

/**
 * @brief How a job's payload travels to the service
 */
enum class submission_mode {
    automatic,       ///< Object storage for large or non-JSON payloads
    inline_only,     ///< Always embed the payload in the submit call
    object_storage   ///< Always stage through object storage
};

[[nodiscard]] constexpr auto to_string(submission_mode mode) -> const char* {
    switch (mode) {
        case submission_mode::automatic: return "automatic";
        case submission_mode::inline_only: return "inline";
        case submission_mode::object_storage: return "object-storage";
        default: return "unknown";
    }
}

/**
 * @brief Identifier for a submitted job
 *
 * Immutable once issued by the service.
 */
class job_handle {
public:
    job_handle(std::string id, std::string backend, submission_mode mode)
        : id_(std::move(id)), backend_(std::move(backend)), mode_(mode) {}

    [[nodiscard]] auto id() const -> const std::string& { return id_; }
    [[nodiscard]] auto backend() const -> const std::string& { return backend_; }

    /**
     * @brief Either inline_only or object_storage, never automatic
     */
    [[nodiscard]] auto mode() const noexcept -> submission_mode { return mode_; }

    [[nodiscard]] auto uses_object_storage() const noexcept -> bool {
        return mode_ == submission_mode::object_storage;
    }

private:
    std::string id_;
    std::string backend_;
    submission_mode mode_;
};

/**
 * @brief A single decoded status frame or status response
 */
struct status_event {
    std::string job_id;
    job_status status = job_status::queued;
    std::string raw_payload;
};

/**
 * @brief Tracks the observed status of one job
 *
 * Once a terminal status has been observed, later observations are ignored
 * so the job never appears to move back to a non-terminal state.
 */
class job_status_latch {
public:
    /**
     * @brief Record an observation
     * @return true if the observation was accepted
     */
    auto observe(job_status status) -> bool {
        std::lock_guard lock(mutex_);
        if (current_ && is_terminal(*current_)) {
            return false;
        }
        current_ = status;
        return true;
    }

    [[nodiscard]] auto current() const -> std::optional<job_status> {
        std::lock_guard lock(mutex_);
        return current_;
    }

    [[nodiscard]] auto is_final() const -> bool {
        std::lock_guard lock(mutex_);
        return current_.has_value() && is_terminal(*current_);
    }

private:
    mutable std::mutex mutex_;
    std::optional<job_status> current_;
};

}  // namespace jobwire

#endif  // JOBWIRE_CORE_JOB_TYPES_H
