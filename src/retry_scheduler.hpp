#pragma once

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>

#include "journal_config.hpp"
#include "journal_status.hpp"

namespace journal {
    /// Backoff wait. sleepFor() returns false when the wait was cancelled.
    class Sleeper {
    public:
        virtual ~Sleeper() = default;

        virtual bool sleepFor(std::chrono::milliseconds delay) = 0;

        /// Wake any current wait and make further waits return false until reset().
        virtual void cancel() = 0;

        virtual void reset() = 0;
    };

    class ThreadSleeper final : public Sleeper {
    public:
        bool sleepFor(std::chrono::milliseconds delay) override;

        void cancel() override;

        void reset() override;

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        bool cancelled_ = false;
    };

    template<typename T>
    struct RetryableOperation {
        T payload;
        /// Attempts made so far.
        int attempt = 0;
        /// Delay that preceded (or would precede) the next attempt.
        std::chrono::milliseconds next_delay{0};
        /// Total backoff spent on this operation.
        std::chrono::milliseconds waited{0};
    };

    /// Bounded retry with exponential backoff: one attempt plus up to max_retries retries,
    /// retry n waiting base_delay * 2^n. The final failure is always returned.
    class BatchRetryScheduler {
    public:
        BatchRetryScheduler(const RetryTuning &tuning, Sleeper &sleeper);

        [[nodiscard]] std::chrono::milliseconds delayForRetry(int retry) const;

        [[nodiscard]] int maxRetries() const { return max_retries_; }

        /// Interrupt the current backoff wait and fail further waits with CANCELLED until reset().
        void cancel() { sleeper_.cancel(); }

        void reset() { sleeper_.reset(); }

        /// Run @p operation on @p op.payload until it succeeds or retries run out.
        /// With a @p budget, stops with TIMED_OUT instead of starting a wait that would
        /// push the total backoff past it.
        template<typename T, typename Operation>
        OpResult execute(RetryableOperation<T> &op, Operation &&operation,
                         std::optional<std::chrono::milliseconds> budget = std::nullopt) {
            while (true) {
                OpResult last = operation(op.payload);
                ++op.attempt;
                if (last.ok()) {
                    if (op.attempt > 1) {
                        std::cout << "[Retry] succeeded after " << op.attempt << " attempts" << std::endl;
                    }
                    return last;
                }
                if (op.attempt > max_retries_) {
                    std::cout << "[Retry] giving up after " << op.attempt << " attempts: "
                            << describe(last) << std::endl;
                    return OpResult::failure(JournalStatus::RETRY_EXHAUSTED, last.message);
                }

                op.next_delay = delayForRetry(op.attempt - 1);
                if (budget && op.waited + op.next_delay > *budget) {
                    std::cout << "[Retry] budget " << budget->count() << "ms exhausted after "
                            << op.attempt << " attempts" << std::endl;
                    return OpResult::failure(JournalStatus::TIMED_OUT, last.message);
                }
                std::cout << "[Retry] attempt " << op.attempt << " failed (" << describe(last)
                        << "), retrying in " << op.next_delay.count() << "ms" << std::endl;
                if (!sleeper_.sleepFor(op.next_delay)) {
                    std::cout << "[Retry] backoff cancelled" << std::endl;
                    return OpResult::failure(JournalStatus::CANCELLED, last.message);
                }
                op.waited += op.next_delay;
            }
        }

        template<typename Operation>
        OpResult execute(Operation &&operation,
                         std::optional<std::chrono::milliseconds> budget = std::nullopt) {
            RetryableOperation<std::monostate> op{};
            return execute(op, [&operation](const std::monostate &) { return operation(); }, budget);
        }

    private:
        int max_retries_ = 3;
        std::chrono::milliseconds base_delay_{1000};
        Sleeper &sleeper_;
    };
} // namespace journal
