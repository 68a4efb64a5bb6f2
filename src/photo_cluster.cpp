#include "photo_cluster.hpp"

#include <stdexcept>
#include <utility>

#include "geo_math.hpp"

namespace journal {
    PhotoCluster::PhotoCluster(std::string id, std::string trip_id, std::vector<PhotoRecord> photos)
        : id_(std::move(id)), trip_id_(std::move(trip_id)), photos_(std::move(photos)) {
        if (photos_.empty()) {
            throw std::invalid_argument("a photo cluster needs at least one photo");
        }
        start_time_ms_ = photos_.front().timestamp_ms;
        end_time_ms_ = photos_.back().timestamp_ms;

        std::vector<GeoPoint> located;
        located.reserve(photos_.size());
        for (const auto &photo: photos_) {
            if (photo.location) located.push_back(*photo.location);
        }
        has_center_location_ = !located.empty();
        center_location_ = GeoMath::centroid(located);
    }

    void PhotoCluster::assignToStep(std::string step_id) {
        assigned_step_id_ = std::move(step_id);
    }
} // namespace journal
