#pragma once

#include <string>
#include <vector>

#include "journal_config.hpp"
#include "journal_types.hpp"
#include "photo_cluster.hpp"

namespace journal {
    class PhotoClusterEngine {
    public:
        PhotoClusterEngine() = default;

        explicit PhotoClusterEngine(const CurationTuning &tuning);

        /// Greedy single-pass chain clustering of @p photos for @p trip_id.
        /// Photos are stable-sorted by timestamp; each photo is compared with the last
        /// photo of the open cluster (not its centroid), so a slowly drifting sequence
        /// may chain into one long cluster.
        [[nodiscard]] std::vector<PhotoCluster> cluster(
            const std::vector<PhotoRecord> &photos,
            const std::string &trip_id) const;

        /// True when @p next may follow @p last inside one cluster.
        [[nodiscard]] bool belongsAfter(const PhotoRecord &last, const PhotoRecord &next) const;

        static std::string makeClusterId(const std::string &trip_id, size_t index);

    private:
        std::int64_t time_window_ms_ = 3600000;
        double radius_m_ = 200.0;
    };
} // namespace journal
