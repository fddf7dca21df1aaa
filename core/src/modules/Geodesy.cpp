#include "modules/Geodesy.h"
#include <algorithm>
#include <cmath>

using Geodesy::kEarthRadiusKm;
using Geodesy::kToDeg;
using Geodesy::kToRad;

double haversineKm(const GeoPoint& a, const GeoPoint& b) {
    const double dlat = (b.lat - a.lat) * kToRad;
    const double dlon = (b.lon - a.lon) * kToRad;
    const double s_lat = std::sin(dlat * 0.5);
    const double s_lon = std::sin(dlon * 0.5);
    double h = s_lat * s_lat + std::cos(a.lat * kToRad) * std::cos(b.lat * kToRad) * s_lon * s_lon;
    h = std::clamp(h, 0.0, 1.0);
    return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(h));
}

double normalizeLongitude(double lon) {
    double wrapped = std::fmod(lon + 180.0, 360.0);
    if (wrapped < 0.0) wrapped += 360.0;
    return wrapped - 180.0;
}

LocalProjection::LocalProjection(const std::vector<GeoPoint>& points) {
    if (points.empty()) return;

    // Spherical mean via the average unit vector
    double sx = 0.0, sy = 0.0, sz = 0.0;
    for (const auto& p : points) {
        double lat = p.lat * kToRad;
        double lon = p.lon * kToRad;
        sx += std::cos(lat) * std::cos(lon);
        sy += std::cos(lat) * std::sin(lon);
        sz += std::sin(lat);
    }
    double norm = std::sqrt(sx * sx + sy * sy + sz * sz);
    if (norm < 1e-9 * points.size()) {
        // Points balance out around the globe: any origin is as good as another
        origin_ = points.front();
    } else {
        origin_.lat = std::asin(std::clamp(sz / norm, -1.0, 1.0)) * kToDeg;
        origin_.lon = std::atan2(sy, sx) * kToDeg;
    }
    sin_lat0_ = std::sin(origin_.lat * kToRad);
    cos_lat0_ = std::cos(origin_.lat * kToRad);
}

PlanarPoint LocalProjection::project(const GeoPoint& p) const {
    const double lat = p.lat * kToRad;
    const double dlon = (p.lon - origin_.lon) * kToRad;
    const double c = haversineKm(origin_, p) / kEarthRadiusKm;   // central angle
    if (c < 1e-15) return {0.0, 0.0};

    const double azimuth = std::atan2(std::sin(dlon) * std::cos(lat),
                                      cos_lat0_ * std::sin(lat) - sin_lat0_ * std::cos(lat) * std::cos(dlon));
    const double rho = kEarthRadiusKm * c;
    return {rho * std::sin(azimuth), rho * std::cos(azimuth)};
}
