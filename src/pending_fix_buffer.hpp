#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "journal_types.hpp"

namespace journal {
    /// Bounded FIFO of fixes waiting for the sink. One producer (ingest) and one
    /// consumer (flush); entries cannot be modified once enqueued.
    class PendingFixBuffer {
    public:
        explicit PendingFixBuffer(size_t capacity);

        /// Returns false, leaving the buffer unchanged, when full.
        bool push(const LocationFix &fix);

        [[nodiscard]] std::optional<LocationFix> front() const;

        /// Drop the head; called only after the sink accepted it.
        void popFront();

        [[nodiscard]] size_t size() const;

        [[nodiscard]] size_t capacity() const { return capacity_; }

        [[nodiscard]] bool empty() const { return size() == 0; }

        [[nodiscard]] bool full() const { return size() >= capacity_; }

    private:
        const size_t capacity_;
        mutable std::mutex mutex_;
        std::deque<LocationFix> fixes_;
    };
} // namespace journal
