#pragma once

#include <algorithm>
#include <cmath>

namespace fraudshield::infra {

constexpr double kEarthRadiusKm = 6371.0088;

// Great-circle distance in kilometres.
inline double haversineKm(double lat1, double lon1, double lat2, double lon2) noexcept {
    constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

    const double dlat = (lat2 - lat1) * kDegToRad;
    const double dlon = (lon2 - lon1) * kDegToRad;

    const double a =
        std::sin(dlat / 2) * std::sin(dlat / 2) +
        std::cos(lat1 * kDegToRad) * std::cos(lat2 * kDegToRad) *
        std::sin(dlon / 2) * std::sin(dlon / 2);

    return 2.0 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(a)));
}

} // namespace fraudshield::infra
