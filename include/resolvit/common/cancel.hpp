#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace resolvit {

    /// Shared cancellation flag with an optional deadline.
    /// Copies observe the same state, so a caller can keep one copy and cancel while workers hold others.
    class CancelToken {
      public:
        using Clock = std::chrono::steady_clock;

        CancelToken() : state_(std::make_shared<State>()) {}

        /// Token that reports cancelled once `deadline` has passed
        inline static CancelToken withDeadline(Clock::time_point deadline) {
            CancelToken token;
            token.state_->deadline = deadline;
            return token;
        }

        inline static CancelToken withTimeout(std::chrono::milliseconds timeout) {
            return withDeadline(Clock::now() + timeout);
        }

        inline void cancel() { state_->cancelled.store(true); }

        inline bool isCancelled() const {
            if (state_->cancelled.load())
                return true;
            return state_->deadline && Clock::now() >= *state_->deadline;
        }

        inline std::optional<Clock::time_point> deadline() const { return state_->deadline; }

        /// Earliest of `limit` and this token's deadline
        inline Clock::time_point clamp(Clock::time_point limit) const {
            if (state_->deadline && *state_->deadline < limit)
                return *state_->deadline;
            return limit;
        }

      private:
        struct State {
            std::atomic<bool> cancelled{false};
            std::optional<Clock::time_point> deadline;
        };

        std::shared_ptr<State> state_;
    };

} // namespace resolvit
