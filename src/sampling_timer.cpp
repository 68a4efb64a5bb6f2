#include "sampling_timer.hpp"

#include <utility>

namespace journal {
    ThreadTimer::ThreadTimer() : worker_([this] { run(); }) {
    }

    ThreadTimer::~ThreadTimer() {
        {
            std::lock_guard lock(mutex_);
            shutdown_ = true;
            task_ = nullptr;
            deadline_.reset();
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void ThreadTimer::schedule(const std::chrono::milliseconds delay, std::function<void()> task) {
        {
            std::lock_guard lock(mutex_);
            task_ = std::move(task);
            deadline_ = std::chrono::steady_clock::now() + delay;
            ++generation_;
        }
        cv_.notify_all();
    }

    void ThreadTimer::cancel() {
        std::unique_lock lock(mutex_);
        task_ = nullptr;
        deadline_.reset();
        ++generation_;
        cv_.notify_all();
        // a task cancelling its own timer must not wait for itself
        if (std::this_thread::get_id() != worker_.get_id()) {
            cv_.wait(lock, [this] { return !running_task_; });
        }
    }

    void ThreadTimer::run() {
        std::unique_lock lock(mutex_);
        while (!shutdown_) {
            if (!deadline_) {
                cv_.wait(lock, [this] { return shutdown_ || deadline_.has_value(); });
                continue;
            }

            const auto deadline = *deadline_;
            const std::uint64_t generation = generation_;
            const bool changed = cv_.wait_until(lock, deadline, [this, generation] {
                return shutdown_ || generation_ != generation;
            });
            if (changed) {
                continue;
            }

            std::function<void()> task = std::move(task_);
            task_ = nullptr;
            deadline_.reset();
            if (!task) {
                continue;
            }

            running_task_ = true;
            lock.unlock();
            task();
            lock.lock();
            running_task_ = false;
            cv_.notify_all();
        }
    }

    void ManualTimer::schedule(const std::chrono::milliseconds delay, std::function<void()> task) {
        task_ = std::move(task);
        delay_ = delay;
        ++scheduled_count_;
    }

    void ManualTimer::cancel() {
        task_ = nullptr;
        delay_ = std::chrono::milliseconds{0};
    }

    bool ManualTimer::fire() {
        if (!task_) {
            return false;
        }
        std::function<void()> task = std::move(task_);
        task_ = nullptr;
        task();
        return true;
    }
} // namespace journal
