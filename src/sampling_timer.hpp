#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "journal_interfaces.hpp"

namespace journal {
    /// Runs scheduled tasks on a single worker thread.
    class ThreadTimer final : public SamplingTimer {
    public:
        ThreadTimer();

        ~ThreadTimer() override;

        ThreadTimer(const ThreadTimer &) = delete;

        ThreadTimer &operator=(const ThreadTimer &) = delete;

        void schedule(std::chrono::milliseconds delay, std::function<void()> task) override;

        void cancel() override;

    private:
        void run();

        std::mutex mutex_;
        std::condition_variable cv_;
        std::optional<std::chrono::steady_clock::time_point> deadline_;
        std::function<void()> task_;
        std::uint64_t generation_ = 0;
        bool running_task_ = false;
        bool shutdown_ = false;
        std::thread worker_;
    };

    /// Holds the pending task until fire() is called. Used for replays and tests.
    class ManualTimer final : public SamplingTimer {
    public:
        void schedule(std::chrono::milliseconds delay, std::function<void()> task) override;

        void cancel() override;

        [[nodiscard]] bool hasPending() const { return static_cast<bool>(task_); }

        [[nodiscard]] std::chrono::milliseconds pendingDelay() const { return delay_; }

        [[nodiscard]] int scheduledCount() const { return scheduled_count_; }

        /// Run the pending task, if any. Returns false when nothing was pending.
        bool fire();

    private:
        std::function<void()> task_;
        std::chrono::milliseconds delay_{0};
        int scheduled_count_ = 0;
    };
} // namespace journal
