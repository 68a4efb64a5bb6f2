#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "journal_types.hpp"

namespace journal {
    /// A contiguous, time-ordered run of photos. Built once from its photos; the only
    /// later change allowed is the step assignment.
    class PhotoCluster {
    public:
        PhotoCluster(std::string id, std::string trip_id, std::vector<PhotoRecord> photos);

        [[nodiscard]] const std::string &id() const { return id_; }
        [[nodiscard]] const std::string &tripId() const { return trip_id_; }
        [[nodiscard]] const std::vector<PhotoRecord> &photos() const { return photos_; }
        [[nodiscard]] size_t size() const { return photos_.size(); }

        /// Mean of the geotagged photos. {0,0} when none carry a location; check
        /// hasCenterLocation() before treating it as a real place.
        [[nodiscard]] const GeoPoint &centerLocation() const { return center_location_; }
        [[nodiscard]] bool hasCenterLocation() const { return has_center_location_; }

        [[nodiscard]] std::int64_t startTime() const { return start_time_ms_; }
        [[nodiscard]] std::int64_t endTime() const { return end_time_ms_; }

        [[nodiscard]] const std::optional<std::string> &assignedStepId() const { return assigned_step_id_; }

        void assignToStep(std::string step_id);

    private:
        std::string id_;
        std::string trip_id_;
        std::vector<PhotoRecord> photos_;
        GeoPoint center_location_;
        bool has_center_location_ = false;
        std::int64_t start_time_ms_ = 0;
        std::int64_t end_time_ms_ = 0;
        std::optional<std::string> assigned_step_id_;
    };
} // namespace journal
