#include "activity_classifier.hpp"

namespace journal {
    ActivityClassifier::ActivityClassifier(const TrackingTuning &tuning)
        : stationary_below_(tuning.stationary_speed_mps),
          walking_below_(tuning.walking_speed_mps),
          driving_below_(tuning.driving_speed_mps),
          train_below_(tuning.flying_speed_mps) {
    }

    MotionState ActivityClassifier::classify(const double speed_mps) const {
        if (speed_mps < stationary_below_) return MotionState::STATIONARY;
        if (speed_mps < walking_below_) return MotionState::WALKING;
        if (speed_mps < driving_below_) return MotionState::DRIVING;
        if (speed_mps < train_below_) return MotionState::TRAIN;
        return MotionState::FLYING;
    }
} // namespace journal
