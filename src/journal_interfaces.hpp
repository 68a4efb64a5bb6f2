#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "journal_status.hpp"
#include "journal_types.hpp"
#include "photo_cluster.hpp"

namespace journal {
    /// Platform location service, asked once per sampling tick.
    class LocationCapability {
    public:
        virtual ~LocationCapability() = default;

        virtual bool hasPermission() = 0;

        /// Latest position sample, or nullopt when the device could not produce one.
        virtual std::optional<RawFix> currentFix() = 0;
    };

    /// Persistence / sync destination. Calls are made through BatchRetryScheduler.
    class JournalSink {
    public:
        virtual ~JournalSink() = default;

        virtual OpResult append(const LocationFix &fix) = 0;

        virtual OpResult appendCluster(const PhotoCluster &cluster) = 0;
    };

    /// Owns the mapping from clusters and dwells to user-facing steps.
    class StepAssignmentListener {
    public:
        virtual ~StepAssignmentListener() = default;

        virtual void onClusterFinalized(const PhotoCluster &cluster) = 0;

        virtual void onDwellEvent(const DwellEvent &event) = 0;
    };

    /// One-shot scheduled task. schedule() replaces any pending task; cancel() returns only
    /// once no task is pending and none is running (unless called from inside the task).
    class SamplingTimer {
    public:
        virtual ~SamplingTimer() = default;

        virtual void schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;

        virtual void cancel() = 0;
    };
} // namespace journal
