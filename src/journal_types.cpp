#include "journal_types.hpp"

namespace journal {
    bool GeoPoint::isValid() const {
        // NaN fails both comparisons
        return latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }

    std::string motionStateToString(const MotionState state) {
        switch (state) {
            case MotionState::STATIONARY:
                return "stationary";
            case MotionState::WALKING:
                return "walking";
            case MotionState::DRIVING:
                return "driving";
            case MotionState::TRAIN:
                return "train";
            case MotionState::FLYING:
                return "flying";
            default:
                return "unknown";
        }
    }

    std::string lifecycleToString(const Lifecycle lifecycle) {
        switch (lifecycle) {
            case Lifecycle::STOPPED:
                return "stopped";
            case Lifecycle::ACTIVE:
                return "active";
            case Lifecycle::PAUSED:
                return "paused";
            default:
                return "unknown";
        }
    }

    std::string dwellStateToString(const DwellState state) {
        switch (state) {
            case DwellState::NONE:
                return "none";
            case DwellState::CANDIDATE:
                return "candidate";
            case DwellState::CONFIRMED:
                return "confirmed";
            default:
                return "unknown";
        }
    }

    std::string dwellEventKindToString(const DwellEventKind kind) {
        switch (kind) {
            case DwellEventKind::VISIT_CANDIDATE:
                return "visit_candidate";
            case DwellEventKind::DWELL_CONFIRMED:
                return "dwell_confirmed";
            case DwellEventKind::DWELL_ENDED:
                return "dwell_ended";
            default:
                return "unknown";
        }
    }
} // namespace journal
