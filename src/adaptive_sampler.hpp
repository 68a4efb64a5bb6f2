#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "journal_config.hpp"
#include "journal_interfaces.hpp"
#include "journal_status.hpp"
#include "journal_types.hpp"
#include "location_ingest.hpp"

namespace journal {
    /// What the location capability is asked for after each fix.
    struct SamplingRequest {
        std::int64_t interval_ms = 0;
        double distance_filter_m = 0;
        double desired_accuracy_m = 0;
    };

    struct TickResult {
        OpResult result;
        std::optional<LocationFix> fix;
        std::vector<DwellEvent> events;
    };

    /// Tracking lifecycle (Stopped -> Active <-> Paused -> Stopped), sampling cadence and
    /// dwell detection for one trip at a time. Owns the TrackingSession; every wake-up of
    /// the timer runs exactly one tick().
    class AdaptiveSampler {
    public:
        AdaptiveSampler(const TrackingTuning &tuning,
                        LocationCapability &location,
                        LocationIngestPipeline &pipeline,
                        SamplingTimer &timer,
                        StepAssignmentListener *listener = nullptr);

        ~AdaptiveSampler();

        AdaptiveSampler(const AdaptiveSampler &) = delete;

        AdaptiveSampler &operator=(const AdaptiveSampler &) = delete;

        OpResult start(const std::string &trip_id);

        OpResult pause();

        OpResult resume();

        /// Flush pending fixes (bounded by flush_timeout_ms) and end the session. Returns
        /// FLUSH_INCOMPLETE when fixes were left behind; the session is stopped either way.
        OpResult stop();

        /// One capture -> classify -> ingest cycle, then schedule the next wake-up.
        TickResult tick();

        [[nodiscard]] TrackingSession session() const;

        [[nodiscard]] Lifecycle lifecycle() const;

        [[nodiscard]] std::int64_t nextIntervalMs() const;

        [[nodiscard]] SamplingRequest currentRequest() const;

    private:
        void scheduleLocked(std::int64_t delay_ms);

        [[nodiscard]] std::int64_t intervalLocked() const;

        void updateBatterySaverLocked(const std::optional<double> &battery_level);

        void updateDwellLocked(const LocationFix &fix, const std::optional<LocationFix> &previous,
                               std::vector<DwellEvent> &events);

        void resetDwellLocked();

        [[nodiscard]] DwellEvent makeDwellEventLocked(DwellEventKind kind, std::int64_t at_ms) const;

        void maybeSyncLocked(std::int64_t now_ms);

        void notify(const std::vector<DwellEvent> &events);

        TrackingTuning tuning_;
        LocationCapability &location_;
        LocationIngestPipeline &pipeline_;
        SamplingTimer &timer_;
        StepAssignmentListener *listener_;

        mutable std::mutex mutex_;
        TrackingSession session_;
        bool stopping_ = false;
    };
} // namespace journal
