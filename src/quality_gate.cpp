#include "quality_gate.hpp"

#include <algorithm>

namespace journal {
    QualityGate::QualityGate(const CurationTuning &tuning) : tuning_(tuning) {
    }

    bool QualityGate::isJunk(const PhotoRecord &photo) const {
        if (photo.is_junk) return true;
        return photo.junk_score.has_value() && *photo.junk_score >= tuning_.junk_threshold;
    }

    bool QualityGate::passes(const PhotoRecord &photo) const {
        return !isJunk(photo) && photo.quality_score >= tuning_.min_quality_score;
    }

    bool QualityGate::isHighlight(const PhotoRecord &photo) const {
        return photo.quality_score >= tuning_.featured_threshold;
    }

    std::vector<PhotoRecord> QualityGate::selectFeatured(const std::vector<PhotoRecord> &photos, const int k) const {
        if (photos.empty() || k <= 0) {
            return {};
        }
        std::vector<PhotoRecord> sorted = photos;
        std::ranges::stable_sort(sorted, [](const PhotoRecord &a, const PhotoRecord &b) {
            return a.quality_score > b.quality_score;
        });
        if (sorted.size() > static_cast<size_t>(k)) {
            sorted.resize(static_cast<size_t>(k));
        }
        return sorted;
    }

    std::vector<PhotoRecord> QualityGate::selectFeatured(const std::vector<PhotoRecord> &photos) const {
        return selectFeatured(photos, tuning_.featured_per_step);
    }

    std::vector<PhotoRecord> QualityGate::capPerStep(const std::vector<PhotoRecord> &photos, const int max) const {
        std::vector<PhotoRecord> kept;
        if (max <= 0) {
            return kept;
        }
        for (const auto &photo: photos) {
            if (static_cast<int>(kept.size()) >= max) break;
            if (passes(photo)) kept.push_back(photo);
        }
        return kept;
    }

    std::vector<PhotoRecord> QualityGate::capPerStep(const std::vector<PhotoRecord> &photos) const {
        return capPerStep(photos, tuning_.max_photos_per_step);
    }

    StepSelection QualityGate::curateStep(const std::vector<PhotoRecord> &photos) const {
        std::vector<PhotoRecord> chronological = photos;
        std::ranges::stable_sort(chronological, [](const PhotoRecord &a, const PhotoRecord &b) {
            return a.timestamp_ms < b.timestamp_ms;
        });

        StepSelection selection;
        selection.photos = capPerStep(chronological);
        selection.featured = selectFeatured(selection.photos);
        return selection;
    }
} // namespace journal
