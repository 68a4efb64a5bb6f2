#pragma once

#include <vector>

#include "journal_config.hpp"
#include "journal_types.hpp"

namespace journal {
    struct StepSelection {
        std::vector<PhotoRecord> photos;    // chronological, gated and capped
        std::vector<PhotoRecord> featured;  // best first
    };

    class QualityGate {
    public:
        QualityGate() = default;

        explicit QualityGate(const CurationTuning &tuning);

        [[nodiscard]] bool isJunk(const PhotoRecord &photo) const;

        [[nodiscard]] bool passes(const PhotoRecord &photo) const;

        [[nodiscard]] bool isHighlight(const PhotoRecord &photo) const;

        /// Top @p k by quality score, ties keep input order.
        [[nodiscard]] std::vector<PhotoRecord> selectFeatured(const std::vector<PhotoRecord> &photos, int k) const;

        [[nodiscard]] std::vector<PhotoRecord> selectFeatured(const std::vector<PhotoRecord> &photos) const;

        /// Photos that pass the gate, truncated to the first @p max in caller order.
        [[nodiscard]] std::vector<PhotoRecord> capPerStep(const std::vector<PhotoRecord> &photos, int max) const;

        [[nodiscard]] std::vector<PhotoRecord> capPerStep(const std::vector<PhotoRecord> &photos) const;

        [[nodiscard]] StepSelection curateStep(const std::vector<PhotoRecord> &photos) const;

    private:
        CurationTuning tuning_;
    };
} // namespace journal
