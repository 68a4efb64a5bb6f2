#pragma once

#include <cstdint>
#include <vector>

#include "journal_types.hpp"

namespace journal {
    class GeoMath {
    public:
        static constexpr double EARTH_RADIUS_M = 6371000.0;

        /// Great-circle (haversine) distance in metres.
        [[nodiscard]] static double distanceMeters(const GeoPoint &a, const GeoPoint &b);

        /// Average ground speed between two timestamped points; 0 when t_b <= t_a.
        [[nodiscard]] static double speedMps(const GeoPoint &a, const GeoPoint &b,
                                             std::int64_t t_a_ms, std::int64_t t_b_ms);

        /// Initial great-circle bearing from a to b, [0°, 360°), 0° = North.
        [[nodiscard]] static double bearingDegrees(const GeoPoint &a, const GeoPoint &b);

        /// Arithmetic mean of latitude / longitude; {0,0} for an empty list.
        [[nodiscard]] static GeoPoint centroid(const std::vector<GeoPoint> &points);

        static double degreeToRadian(double degree);

        static double radianToDegree(double radian);
    };
} // namespace journal
