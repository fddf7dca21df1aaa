#ifndef GEODESY_H
#define GEODESY_H

#include <vector>

namespace Geodesy {
    constexpr double kEarthRadiusKm = 6371.0;
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kToRad = kPi / 180.0;
    constexpr double kToDeg = 180.0 / kPi;
}

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

struct PlanarPoint {
    double x = 0.0;   // km east of the projection origin
    double y = 0.0;   // km north of the projection origin
};

// Great-circle distance in km (haversine formula)
double haversineKm(const GeoPoint& a, const GeoPoint& b);

// Wraps a longitude into [-180, 180)
double normalizeLongitude(double lon);

/**
 * Azimuthal equidistant projection around the spherical mean of a point set.
 *
 * Distances and bearings from the origin are exact, so a cluster of points
 * straddling the antimeridian or sitting near a pole keeps its local shape.
 */
class LocalProjection {
public:
    explicit LocalProjection(const std::vector<GeoPoint>& points);

    PlanarPoint project(const GeoPoint& p) const;

private:
    GeoPoint origin_;
    double sin_lat0_ = 0.0;
    double cos_lat0_ = 1.0;
};

#endif
