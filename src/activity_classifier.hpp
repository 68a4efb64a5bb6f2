#pragma once

#include "journal_config.hpp"
#include "journal_types.hpp"

namespace journal {
    /// Maps an instantaneous speed to a motion state using fixed, non-overlapping bands.
    /// Every sample is classified on its own (no hysteresis), so noisy speeds near a band
    /// edge can flip the state from one fix to the next.
    class ActivityClassifier {
    public:
        ActivityClassifier() = default;

        explicit ActivityClassifier(const TrackingTuning &tuning);

        [[nodiscard]] MotionState classify(double speed_mps) const;

    private:
        double stationary_below_ = 1.0;
        double walking_below_ = 2.0;
        double driving_below_ = 20.0;
        double train_below_ = 55.0;
    };
} // namespace journal
