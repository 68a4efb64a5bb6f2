#include "journal_config.hpp"

#include <opencv2/core.hpp>

#include <cctype>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace journal {
    namespace {
        std::string normalizeProfile(const std::string &profile) {
            std::string normalized;
            normalized.reserve(profile.size());
            for (const unsigned char c: profile) {
                if (std::isalnum(c)) {
                    normalized.push_back(static_cast<char>(std::tolower(c)));
                }
            }
            return normalized;
        }

        void applyBalancedPreset(JournalTuning &tuning) {
            tuning.tracking.active_interval_ms = 30000;
            tuning.tracking.stationary_interval_ms = 600000;
            tuning.tracking.battery_saver_threshold = 0.20;
        }

        void applyPrecisePreset(JournalTuning &tuning) {
            tuning.tracking.active_interval_ms = 15000;
            tuning.tracking.stationary_interval_ms = 300000;
            tuning.tracking.min_displacement_m = 5.0;
            tuning.tracking.battery_saver_threshold = 0.10;
        }

        void applyLowPowerPreset(JournalTuning &tuning) {
            tuning.tracking.active_interval_ms = 60000;
            tuning.tracking.stationary_interval_ms = 900000;
            tuning.tracking.min_displacement_m = 25.0;
            tuning.tracking.battery_saver_threshold = 0.35;
        }

        // -------------------------------------------------------------------
        // cv::FileStorage readers: only touch the target when the key exists
        // -------------------------------------------------------------------
        void readValue(const cv::FileNode &parent, const char *key, std::int64_t &target) {
            const cv::FileNode node = parent[key];
            if (node.empty() || node.isNone()) return;
            if (!node.isInt() && !node.isReal()) {
                throw std::runtime_error(std::string("config key '") + key + "' must be numeric");
            }
            target = static_cast<std::int64_t>(static_cast<double>(node));
        }

        void readValue(const cv::FileNode &parent, const char *key, int &target) {
            const cv::FileNode node = parent[key];
            if (node.empty() || node.isNone()) return;
            if (!node.isInt() && !node.isReal()) {
                throw std::runtime_error(std::string("config key '") + key + "' must be numeric");
            }
            target = static_cast<int>(std::clamp(static_cast<double>(node),
                                                 static_cast<double>(std::numeric_limits<int>::min()),
                                                 static_cast<double>(std::numeric_limits<int>::max())));
        }

        void readValue(const cv::FileNode &parent, const char *key, double &target) {
            const cv::FileNode node = parent[key];
            if (node.empty() || node.isNone()) return;
            if (!node.isInt() && !node.isReal()) {
                throw std::runtime_error(std::string("config key '") + key + "' must be numeric");
            }
            target = static_cast<double>(node);
        }

        // -------------------------------------------------------------------
        // environment readers: bad value -> default, below minimum -> clamped
        // -------------------------------------------------------------------
        std::int64_t envInt64Or(const char *name, const std::int64_t default_value, const std::int64_t min_value) {
            const char *value = std::getenv(name);
            if (!value) {
                return default_value;
            }
            char *end = nullptr;
            const long long parsed = std::strtoll(value, &end, 10);
            if (end == value || *end != '\0') {
                return default_value;
            }
            if (parsed < min_value) {
                return min_value;
            }
            return parsed;
        }

        int envIntOr(const char *name, const int default_value, const int min_value) {
            const std::int64_t parsed = envInt64Or(name, default_value, min_value);
            return static_cast<int>(std::min<std::int64_t>(parsed, std::numeric_limits<int>::max()));
        }

        double envDoubleOr(const char *name, const double default_value, const double min_value) {
            const char *value = std::getenv(name);
            if (!value) {
                return default_value;
            }
            char *end = nullptr;
            const double parsed = std::strtod(value, &end);
            if (end == value || *end != '\0') {
                return default_value;
            }
            if (parsed < min_value) {
                return min_value;
            }
            return parsed;
        }
    }

    JournalTuning loadJournalTuning(const std::string &profile) {
        JournalTuning tuning;

        const std::string normalized = normalizeProfile(profile);
        if (normalized.empty() || normalized == "balanced" || normalized == "default") {
            applyBalancedPreset(tuning);
        } else if (normalized == "precise" || normalized == "highaccuracy") {
            applyPrecisePreset(tuning);
        } else if (normalized == "lowpower" || normalized == "eco" || normalized == "batterysaver") {
            applyLowPowerPreset(tuning);
        } else {
            std::cout << "[Config] unknown profile '" << profile << "', using balanced" << std::endl;
            applyBalancedPreset(tuning);
        }
        return tuning;
    }

    void loadJournalTuningFile(const std::string &path, JournalTuning &tuning) {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            throw std::runtime_error("config file not readable: " + path);
        }
        std::cout << "[Config] reading: " << path << std::endl;

        const cv::FileNode tracking = fs["tracking"];
        if (!tracking.empty()) {
            auto &t = tuning.tracking;
            readValue(tracking, "activeIntervalMs", t.active_interval_ms);
            readValue(tracking, "stationaryIntervalMs", t.stationary_interval_ms);
            readValue(tracking, "idleIntervalMs", t.idle_interval_ms);
            readValue(tracking, "minDisplacementM", t.min_displacement_m);
            readValue(tracking, "stationaryRadiusM", t.stationary_radius_m);
            readValue(tracking, "shortStopMs", t.short_stop_ms);
            readValue(tracking, "minDwellMs", t.min_dwell_ms);
            readValue(tracking, "batterySaverThreshold", t.battery_saver_threshold);
            readValue(tracking, "stationarySpeedMps", t.stationary_speed_mps);
            readValue(tracking, "walkingSpeedMps", t.walking_speed_mps);
            readValue(tracking, "drivingSpeedMps", t.driving_speed_mps);
            readValue(tracking, "flyingSpeedMps", t.flying_speed_mps);
            readValue(tracking, "highAccuracyM", t.high_accuracy_m);
            readValue(tracking, "mediumAccuracyM", t.medium_accuracy_m);
            readValue(tracking, "lowAccuracyM", t.low_accuracy_m);
            readValue(tracking, "syncIntervalMs", t.sync_interval_ms);
            readValue(tracking, "syncBatchSize", t.sync_batch_size);
            readValue(tracking, "pendingCapacity", t.pending_capacity);
            readValue(tracking, "flushTimeoutMs", t.flush_timeout_ms);
            readValue(tracking, "backpressureTimeoutMs", t.backpressure_timeout_ms);
        }

        const cv::FileNode curation = fs["curation"];
        if (!curation.empty()) {
            auto &c = tuning.curation;
            readValue(curation, "minQualityScore", c.min_quality_score);
            readValue(curation, "featuredThreshold", c.featured_threshold);
            readValue(curation, "junkThreshold", c.junk_threshold);
            readValue(curation, "maxPhotosPerStep", c.max_photos_per_step);
            readValue(curation, "featuredPerStep", c.featured_per_step);
            readValue(curation, "timeClusterWindowMs", c.time_cluster_window_ms);
            readValue(curation, "locationClusterRadiusM", c.location_cluster_radius_m);
        }

        const cv::FileNode retry = fs["retry"];
        if (!retry.empty()) {
            readValue(retry, "maxRetries", tuning.retry.max_retries);
            readValue(retry, "retryBaseDelayMs", tuning.retry.retry_base_delay_ms);
        }
    }

    void applyEnvironmentOverrides(JournalTuning &tuning) {
        auto &t = tuning.tracking;
        t.active_interval_ms = envInt64Or("JOURNAL_ACTIVE_INTERVAL_MS", t.active_interval_ms, 1000);
        t.stationary_interval_ms = envInt64Or("JOURNAL_STATIONARY_INTERVAL_MS", t.stationary_interval_ms, 1000);
        t.idle_interval_ms = envInt64Or("JOURNAL_IDLE_INTERVAL_MS", t.idle_interval_ms, 1000);
        t.min_displacement_m = envDoubleOr("JOURNAL_MIN_DISPLACEMENT_M", t.min_displacement_m, 0.0);
        t.stationary_radius_m = envDoubleOr("JOURNAL_STATIONARY_RADIUS_M", t.stationary_radius_m, 1.0);
        t.short_stop_ms = envInt64Or("JOURNAL_SHORT_STOP_MS", t.short_stop_ms, 0);
        t.min_dwell_ms = envInt64Or("JOURNAL_MIN_DWELL_MS", t.min_dwell_ms, 0);
        t.battery_saver_threshold = envDoubleOr("JOURNAL_BATTERY_SAVER_THRESHOLD", t.battery_saver_threshold, 0.0);
        t.sync_interval_ms = envInt64Or("JOURNAL_SYNC_INTERVAL_MS", t.sync_interval_ms, 0);
        t.sync_batch_size = envIntOr("JOURNAL_SYNC_BATCH_SIZE", t.sync_batch_size, 1);
        t.pending_capacity = envIntOr("JOURNAL_PENDING_CAPACITY", t.pending_capacity, 1);
        t.flush_timeout_ms = envInt64Or("JOURNAL_FLUSH_TIMEOUT_MS", t.flush_timeout_ms, 0);
        t.backpressure_timeout_ms = envInt64Or("JOURNAL_BACKPRESSURE_TIMEOUT_MS", t.backpressure_timeout_ms, 0);

        auto &c = tuning.curation;
        c.min_quality_score = envDoubleOr("JOURNAL_MIN_QUALITY_SCORE", c.min_quality_score, 0.0);
        c.featured_threshold = envDoubleOr("JOURNAL_FEATURED_THRESHOLD", c.featured_threshold, 0.0);
        c.junk_threshold = envDoubleOr("JOURNAL_JUNK_THRESHOLD", c.junk_threshold, 0.0);
        c.max_photos_per_step = envIntOr("JOURNAL_MAX_PHOTOS_PER_STEP", c.max_photos_per_step, 0);
        c.featured_per_step = envIntOr("JOURNAL_FEATURED_PER_STEP", c.featured_per_step, 0);
        c.time_cluster_window_ms = envInt64Or("JOURNAL_TIME_CLUSTER_WINDOW_MS", c.time_cluster_window_ms, 0);
        c.location_cluster_radius_m = envDoubleOr("JOURNAL_LOCATION_CLUSTER_RADIUS_M", c.location_cluster_radius_m, 0.0);

        tuning.retry.max_retries = envIntOr("JOURNAL_MAX_RETRIES", tuning.retry.max_retries, 0);
        tuning.retry.retry_base_delay_ms = envInt64Or("JOURNAL_RETRY_BASE_DELAY_MS", tuning.retry.retry_base_delay_ms, 0);
    }

    void logJournalTuning(const JournalTuning &tuning) {
        const auto &t = tuning.tracking;
        const auto &c = tuning.curation;
        std::cout << "[Config] tracking: active=" << t.active_interval_ms << "ms"
                << ", stationary=" << t.stationary_interval_ms << "ms"
                << ", idle=" << t.idle_interval_ms << "ms"
                << ", short_stop=" << t.short_stop_ms << "ms"
                << ", min_dwell=" << t.min_dwell_ms << "ms"
                << ", battery_saver<" << t.battery_saver_threshold
                << ", pending_capacity=" << t.pending_capacity
                << ", sync_batch=" << t.sync_batch_size
                << ", flush_timeout=" << t.flush_timeout_ms << "ms"
                << ", backpressure_timeout=" << t.backpressure_timeout_ms << "ms" << std::endl;
        std::cout << "[Config] curation: min_quality=" << c.min_quality_score
                << ", featured>=" << c.featured_threshold
                << ", junk>=" << c.junk_threshold
                << ", max_per_step=" << c.max_photos_per_step
                << ", featured_per_step=" << c.featured_per_step
                << ", window=" << c.time_cluster_window_ms << "ms"
                << ", radius=" << c.location_cluster_radius_m << "m" << std::endl;
        std::cout << "[Config] retry: max_retries=" << tuning.retry.max_retries
                << ", base_delay=" << tuning.retry.retry_base_delay_ms << "ms" << std::endl;
    }
} // namespace journal
