#include "retry_scheduler.hpp"

#include <algorithm>

namespace journal {
    bool ThreadSleeper::sleepFor(const std::chrono::milliseconds delay) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, delay, [this] { return cancelled_; });
        return !cancelled_;
    }

    void ThreadSleeper::cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void ThreadSleeper::reset() {
        std::lock_guard lock(mutex_);
        cancelled_ = false;
    }

    BatchRetryScheduler::BatchRetryScheduler(const RetryTuning &tuning, Sleeper &sleeper)
        : max_retries_(std::max(0, tuning.max_retries)),
          base_delay_(std::max<std::int64_t>(0, tuning.retry_base_delay_ms)),
          sleeper_(sleeper) {
    }

    std::chrono::milliseconds BatchRetryScheduler::delayForRetry(const int retry) const {
        // keep the shift well inside 64 bits
        const int exponent = std::clamp(retry, 0, 30);
        return base_delay_ * (std::int64_t{1} << exponent);
    }
} // namespace journal
