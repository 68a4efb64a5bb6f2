#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace journal {
    struct GeoPoint {
        double latitude = 0;    // WGS84, degrees
        double longitude = 0;   // WGS84, degrees

        [[nodiscard]] bool isValid() const;

        bool operator==(const GeoPoint &other) const = default;
    };

    enum class MotionState {
        STATIONARY,
        WALKING,
        DRIVING,
        TRAIN,
        FLYING
    };

    std::string motionStateToString(MotionState state);

    [[nodiscard]] inline bool isMoving(const MotionState state) {
        return state != MotionState::STATIONARY;
    }

    /// One sample as delivered by the location capability, before classification.
    struct RawFix {
        GeoPoint point;
        std::int64_t timestamp_ms = 0;
        std::optional<double> accuracy;      // m
        std::optional<double> altitude;      // m
        std::optional<double> speed;         // m/s, as reported by the device
        std::optional<double> heading;       // degrees, 0 = North
        std::optional<double> battery_level; // 0.0 - 1.0
    };

    struct LocationFix {
        std::string trip_id;
        GeoPoint point;
        std::int64_t timestamp_ms = 0;
        std::optional<double> accuracy;
        std::optional<double> altitude;
        std::optional<double> speed;
        std::optional<double> heading;
        MotionState activity = MotionState::STATIONARY;
        std::optional<double> battery_level;
    };

    struct PhotoRecord {
        std::string id;
        std::int64_t timestamp_ms = 0;
        std::optional<GeoPoint> location;
        double quality_score = 0;   // 0.0 - 1.0, from the scoring capability
        bool is_junk = false;
        /// Raw junk classifier output when the scorer provides it.
        std::optional<double> junk_score;
        int width = 0;
        int height = 0;
    };

    enum class Lifecycle {
        STOPPED,
        ACTIVE,
        PAUSED
    };

    std::string lifecycleToString(Lifecycle lifecycle);

    enum class DwellState {
        NONE,
        CANDIDATE,  // stationary >= short stop
        CONFIRMED   // stationary >= minimum dwell
    };

    std::string dwellStateToString(DwellState state);

    struct TrackingSession {
        std::string trip_id;
        Lifecycle lifecycle = Lifecycle::STOPPED;
        MotionState current_activity = MotionState::STATIONARY;
        std::optional<LocationFix> last_fix;

        std::optional<std::int64_t> dwell_started_at;
        std::optional<GeoPoint> dwell_anchor;
        DwellState dwell_state = DwellState::NONE;

        bool battery_saver = false;
        std::optional<std::int64_t> last_sync_ms;

        /// Captured fix the pending buffer refused under backpressure. Offered again
        /// before any new capture.
        std::optional<RawFix> deferred_fix;

        [[nodiscard]] bool hasSession() const { return !trip_id.empty(); }
    };

    enum class DwellEventKind {
        VISIT_CANDIDATE,
        DWELL_CONFIRMED,
        DWELL_ENDED
    };

    std::string dwellEventKindToString(DwellEventKind kind);

    struct DwellEvent {
        DwellEventKind kind = DwellEventKind::VISIT_CANDIDATE;
        std::string trip_id;
        GeoPoint location;
        std::int64_t started_at_ms = 0;
        /// Timestamp of the fix that produced the event.
        std::int64_t at_ms = 0;

        [[nodiscard]] std::int64_t durationMs() const { return at_ms - started_at_ms; }
    };
} // namespace journal
