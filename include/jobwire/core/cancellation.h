/**
 * @file cancellation.h
 * @brief Caller-initiated cancellation of a status wait
 */

#ifndef JOBWIRE_CORE_CANCELLATION_H
#define JOBWIRE_CORE_CANCELLATION_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace jobwire {

/**
 * @brief Shared cancellation flag with wake-up callbacks
 *
 * Copies share state. Callbacks registered while the token is live run once,
 * on the thread that calls cancel(). Registering on an already cancelled
 * token runs the callback immediately.
 *
 * @code
 * cancellation_token token;
 * auto future = client.submit_and_wait_async(payload, "simulator", 60s,
 *                                            {.cancel = token});
 * token.cancel();  // closes the channel, result reports error_code::cancelled
 * @endcode
 */
class cancellation_token {
public:
    using callback = std::function<void()>;

    cancellation_token() : state_(std::make_shared<state>()) {}

    /**
     * @brief Request cancellation
     */
    void cancel() {
        std::map<uint64_t, callback> to_run;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->cancelled) {
                return;
            }
            state_->cancelled = true;
            to_run.swap(state_->callbacks);
        }
        state_->cv.notify_all();
        for (auto& [id, fn] : to_run) {
            fn();
        }
    }

    [[nodiscard]] auto is_cancelled() const -> bool {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Sleep for @p duration unless cancelled first
     * @return true if cancelled
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds duration) const -> bool {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
    }

    /**
     * @brief Register a callback for cancel()
     * @return Registration id, 0 if the callback already ran
     */
    auto register_callback(callback fn) -> uint64_t {
        {
            std::lock_guard lock(state_->mutex);
            if (!state_->cancelled) {
                auto id = ++state_->next_id;
                state_->callbacks.emplace(id, std::move(fn));
                return id;
            }
        }
        fn();
        return 0;
    }

    void unregister_callback(uint64_t id) {
        std::lock_guard lock(state_->mutex);
        state_->callbacks.erase(id);
    }

private:
    struct state {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        uint64_t next_id = 0;
        std::map<uint64_t, callback> callbacks;
    };

    std::shared_ptr<state> state_;
};

/**
 * @brief RAII registration of a cancellation callback
 */
class cancellation_registration {
public:
    cancellation_registration(cancellation_token token, cancellation_token::callback fn)
        : token_(std::move(token)), id_(token_.register_callback(std::move(fn))) {}

    ~cancellation_registration() {
        if (id_ != 0) {
            token_.unregister_callback(id_);
        }
    }

    cancellation_registration(const cancellation_registration&) = delete;
    auto operator=(const cancellation_registration&) -> cancellation_registration& = delete;

private:
    cancellation_token token_;
    uint64_t id_;
};

}  // namespace jobwire

#endif  // JOBWIRE_CORE_CANCELLATION_H
