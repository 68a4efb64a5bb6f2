#include "geo_math.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>

namespace journal {
    double GeoMath::degreeToRadian(const double degree) {
        return degree * CV_PI / 180.0;
    }

    double GeoMath::radianToDegree(const double radian) {
        return radian * 180.0 / CV_PI;
    }

    double GeoMath::distanceMeters(const GeoPoint &a, const GeoPoint &b) {
        const double phi1 = degreeToRadian(a.latitude);
        const double phi2 = degreeToRadian(b.latitude);
        const double dphi = degreeToRadian(b.latitude - a.latitude);
        const double dlambda = degreeToRadian(b.longitude - a.longitude);

        const double sin_dphi = std::sin(dphi / 2.0);
        const double sin_dlambda = std::sin(dlambda / 2.0);
        double h = sin_dphi * sin_dphi + std::cos(phi1) * std::cos(phi2) * sin_dlambda * sin_dlambda;
        // rounding can push h slightly outside [0,1] near identical / antipodal points
        h = std::clamp(h, 0.0, 1.0);

        const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
        return EARTH_RADIUS_M * c;
    }

    double GeoMath::speedMps(const GeoPoint &a, const GeoPoint &b,
                             const std::int64_t t_a_ms, const std::int64_t t_b_ms) {
        if (t_b_ms <= t_a_ms) {
            return 0.0;
        }
        const double seconds = static_cast<double>(t_b_ms - t_a_ms) / 1000.0;
        return distanceMeters(a, b) / seconds;
    }

    double GeoMath::bearingDegrees(const GeoPoint &a, const GeoPoint &b) {
        const double phi1 = degreeToRadian(a.latitude);
        const double phi2 = degreeToRadian(b.latitude);
        const double dlambda = degreeToRadian(b.longitude - a.longitude);

        const double y = std::sin(dlambda) * std::cos(phi2);
        const double x = std::cos(phi1) * std::sin(phi2) - std::sin(phi1) * std::cos(phi2) * std::cos(dlambda);
        double bearing = radianToDegree(std::atan2(y, x));
        if (bearing < 0.0) {
            bearing += 360.0;
        }
        if (bearing >= 360.0) {
            bearing -= 360.0;
        }
        return bearing;
    }

    GeoPoint GeoMath::centroid(const std::vector<GeoPoint> &points) {
        if (points.empty()) {
            return {0.0, 0.0};
        }
        double lat_sum = 0.0;
        double lon_sum = 0.0;
        for (const auto &p: points) {
            lat_sum += p.latitude;
            lon_sum += p.longitude;
        }
        return {
            lat_sum / static_cast<double>(points.size()),
            lon_sum / static_cast<double>(points.size())
        };
    }
} // namespace journal
