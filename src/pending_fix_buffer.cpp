#include "pending_fix_buffer.hpp"

#include <algorithm>

namespace journal {
    PendingFixBuffer::PendingFixBuffer(const size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {
    }

    bool PendingFixBuffer::push(const LocationFix &fix) {
        std::lock_guard lock(mutex_);
        if (fixes_.size() >= capacity_) {
            return false;
        }
        fixes_.push_back(fix);
        return true;
    }

    std::optional<LocationFix> PendingFixBuffer::front() const {
        std::lock_guard lock(mutex_);
        if (fixes_.empty()) {
            return std::nullopt;
        }
        return fixes_.front();
    }

    void PendingFixBuffer::popFront() {
        std::lock_guard lock(mutex_);
        if (!fixes_.empty()) {
            fixes_.pop_front();
        }
    }

    size_t PendingFixBuffer::size() const {
        std::lock_guard lock(mutex_);
        return fixes_.size();
    }
} // namespace journal
