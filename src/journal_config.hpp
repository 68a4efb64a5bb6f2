#pragma once

#include <cstdint>
#include <string>

namespace journal {
    struct TrackingTuning {
        /// Sampling interval while moving (walking, driving, train, flying)
        std::int64_t active_interval_ms = 30000;
        /// Sampling interval while stationary, also forced in battery-saver mode
        std::int64_t stationary_interval_ms = 600000;
        /// Retry cadence when a tick obtained no fix
        std::int64_t idle_interval_ms = 300000;

        /// Distance filter handed to the location capability (m)
        double min_displacement_m = 10.0;
        /// A stationary run whose fixes drift further than this from its anchor restarts (m)
        double stationary_radius_m = 50.0;

        /// Stationary this long -> visit candidate
        std::int64_t short_stop_ms = 300000;
        /// Stationary this long -> confirmed dwell
        std::int64_t min_dwell_ms = 1800000;

        /// Battery level (0-1) below which sampling drops to the stationary cadence
        double battery_saver_threshold = 0.20;

        // Speed bands (m/s), each the inclusive lower edge of the next state
        double stationary_speed_mps = 1.0;
        double walking_speed_mps = 2.0;
        double driving_speed_mps = 20.0;
        double flying_speed_mps = 55.0;

        // Requested accuracy tiers (m)
        double high_accuracy_m = 10.0;
        double medium_accuracy_m = 100.0;
        double low_accuracy_m = 1000.0;

        /// Flush the pending buffer at least this often (fix time)
        std::int64_t sync_interval_ms = 300000;
        /// Flush once this many fixes are pending
        int sync_batch_size = 50;
        /// Pending buffer capacity; when full the oldest fix is pushed to the sink first
        int pending_capacity = 500;
        /// Upper bound on the final flush performed by stop()
        std::int64_t flush_timeout_ms = 10000;
        /// Backoff a tick may spend pushing the oldest fix out of a full buffer
        std::int64_t backpressure_timeout_ms = 10000;
    };

    struct CurationTuning {
        double min_quality_score = 0.5;
        /// Photos at or above this score count as highlights
        double featured_threshold = 0.8;
        /// junk_score at or above this marks a photo as junk
        double junk_threshold = 0.7;

        int max_photos_per_step = 10;
        int featured_per_step = 3;

        /// Max gap between consecutive photos of one cluster
        std::int64_t time_cluster_window_ms = 3600000;
        /// Max distance between consecutive geotagged photos of one cluster (m)
        double location_cluster_radius_m = 200.0;
    };

    struct RetryTuning {
        int max_retries = 3;
        std::int64_t retry_base_delay_ms = 1000;
    };

    struct JournalTuning {
        TrackingTuning tracking;
        CurationTuning curation;
        RetryTuning retry;
    };

    /// Defaults with a named profile applied ("balanced", "precise", "low_power").
    JournalTuning loadJournalTuning(const std::string &profile = "balanced");

    /// Overlay a YAML/JSON file (cv::FileStorage) on top of @p tuning. Missing keys are left untouched.
    void loadJournalTuningFile(const std::string &path, JournalTuning &tuning);

    /// Overlay JOURNAL_* environment variables on top of @p tuning.
    void applyEnvironmentOverrides(JournalTuning &tuning);

    void logJournalTuning(const JournalTuning &tuning);
} // namespace journal
