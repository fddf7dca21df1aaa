#ifndef HEX_GRID_H
#define HEX_GRID_H

#include <cstdint>
#include <vector>

#include "modules/Geodesy.h"

class SampleStore;
struct TimeBin;

// H3 cell index
using CellId = std::uint64_t;

struct HexCell {
    CellId id = 0;
    std::uint32_t bin = 0;
    double centerLat = 0.0;
    double centerLon = 0.0;
    std::vector<std::uint32_t> members;   // sample rows, ascending, never empty
};

/**
 * H3 hexagonal tessellation of the globe at one resolution level.
 *
 * Cells tile the whole sphere, poles and antimeridian included; the twelve
 * pentagons per level are cells like any other. Lookup is a pure function
 * of (lat, lon, level). Centers and boundaries come from H3 and are
 * reported in degrees, longitude in [-180, 180].
 */
class HexGrid {
public:
    static constexpr int kMaxResolution = 15;

    explicit HexGrid(int resolution);

    CellId cellFor(double lat, double lon) const;
    CellId cellFor(const GeoPoint& p) const { return cellFor(p.lat, p.lon); }

    GeoPoint cellCenter(CellId id) const;

    // Corners in H3 order (counter-clockwise); 5 for pentagons, up to 10
    // where a cell crosses an icosahedron face
    std::vector<GeoPoint> cellBoundary(CellId id) const;

    // Hex steps between two cells of this grid, -1 where H3 cannot
    // measure it (far apart or across a pentagon)
    int gridDistance(CellId a, CellId b) const;

    // Groups the bin's samples into occupied cells, ordered by cell id
    std::vector<HexCell> indexBin(const TimeBin& bin, const SampleStore& store) const;

    double edgeLengthKm() const { return edge_km_; }

    // Average hexagon edge length of a level
    static double edgeLengthKm(int resolution);

    // Throws std::invalid_argument for anything that is not a valid cell
    static int resolutionOf(CellId id);

private:
    int resolution_;
    double edge_km_;

    void checkOwnership(CellId id) const;
};

#endif
