#pragma once

#include <chrono>
#include <optional>

#include "activity_classifier.hpp"
#include "journal_config.hpp"
#include "journal_interfaces.hpp"
#include "journal_status.hpp"
#include "journal_types.hpp"
#include "pending_fix_buffer.hpp"
#include "retry_scheduler.hpp"

namespace journal {
    struct IngestResult {
        OpResult result;
        /// The built fix. Also set when it was rejected under backpressure so the caller
        /// still holds it.
        std::optional<LocationFix> fix;
        bool accepted = false;
    };

    class LocationIngestPipeline {
    public:
        LocationIngestPipeline(const TrackingTuning &tuning, JournalSink &sink, BatchRetryScheduler &retry);

        /// Classify @p raw against the session's previous fix, advance the session and
        /// queue the fix for the sink. Invalid coordinates are rejected without touching
        /// the session. A full buffer first pushes its oldest fix to the sink, bounded by
        /// backpressure_timeout_ms of backoff; if that fails the new fix is rejected, the
        /// session is not advanced and nothing buffered is lost.
        IngestResult ingest(TrackingSession &session, const RawFix &raw);

        /// Deliver pending fixes in arrival order. Stops at the first fix the sink keeps
        /// refusing; that fix stays at the head for the next flush. @p budget bounds the
        /// total backoff time spent; @p waited, when given, receives it.
        OpResult flush(std::optional<std::chrono::milliseconds> budget = std::nullopt,
                       std::chrono::milliseconds *waited = nullptr);

        /// Wake a delivery blocked in backoff; deliveries fail with CANCELLED until allowRetries().
        void interruptRetries() { retry_.cancel(); }

        void allowRetries() { retry_.reset(); }

        [[nodiscard]] size_t pendingCount() const { return pending_.size(); }

        [[nodiscard]] const PendingFixBuffer &pending() const { return pending_; }

    private:
        [[nodiscard]] LocationFix buildFix(const TrackingSession &session, const RawFix &raw) const;

        OpResult deliverOldest(std::optional<std::chrono::milliseconds> budget, std::chrono::milliseconds &waited);

        ActivityClassifier classifier_;
        JournalSink &sink_;
        BatchRetryScheduler &retry_;
        PendingFixBuffer pending_;
        std::chrono::milliseconds backpressure_budget_;
    };
} // namespace journal
