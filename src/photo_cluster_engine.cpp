#include "photo_cluster_engine.hpp"

#include <algorithm>
#include <iostream>

#include "geo_math.hpp"

namespace journal {
    PhotoClusterEngine::PhotoClusterEngine(const CurationTuning &tuning)
        : time_window_ms_(tuning.time_cluster_window_ms),
          radius_m_(tuning.location_cluster_radius_m) {
    }

    bool PhotoClusterEngine::belongsAfter(const PhotoRecord &last, const PhotoRecord &next) const {
        const std::int64_t time_diff = next.timestamp_ms - last.timestamp_ms;
        const bool within_time_window = time_diff <= time_window_ms_;

        // spatial test only applies when both photos are geotagged
        bool within_radius = true;
        if (last.location && next.location) {
            within_radius = GeoMath::distanceMeters(*last.location, *next.location) <= radius_m_;
        }
        return within_time_window && within_radius;
    }

    std::string PhotoClusterEngine::makeClusterId(const std::string &trip_id, const size_t index) {
        return trip_id + "-cluster-" + std::to_string(index);
    }

    std::vector<PhotoCluster> PhotoClusterEngine::cluster(
        const std::vector<PhotoRecord> &photos,
        const std::string &trip_id) const {
        std::vector<PhotoCluster> clusters;
        if (photos.empty()) {
            std::cout << "[Cluster] empty photo list, return empty clusters" << std::endl;
            return clusters;
        }

        std::vector<PhotoRecord> sorted = photos;
        std::ranges::stable_sort(sorted, [](const PhotoRecord &a, const PhotoRecord &b) {
            return a.timestamp_ms < b.timestamp_ms;
        });

        std::vector<PhotoRecord> current{sorted.front()};
        for (size_t i = 1; i < sorted.size(); ++i) {
            const auto &photo = sorted[i];
            if (belongsAfter(current.back(), photo)) {
                current.push_back(photo);
                continue;
            }
            clusters.emplace_back(makeClusterId(trip_id, clusters.size()), trip_id, std::move(current));
            current = {photo};
        }
        clusters.emplace_back(makeClusterId(trip_id, clusters.size()), trip_id, std::move(current));

        std::cout << "[Cluster] trip=" << trip_id << ", photos=" << photos.size()
                << ", clusters=" << clusters.size() << std::endl;
        return clusters;
    }
} // namespace journal
