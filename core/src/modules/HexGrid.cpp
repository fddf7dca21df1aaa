#include "modules/HexGrid.h"
#include "kernel/Errors.h"
#include "kernel/SampleStore.h"
#include "modules/TimeBinner.h"
#include <h3/h3api.h>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>

namespace {

std::string errorText(const char* what, H3Error err) {
    return std::string(what) + " failed (H3 error " + std::to_string(err) + ")";
}

GeoPoint toGeoPoint(const LatLng& ll) {
    return {radsToDegs(ll.lat), normalizeLongitude(radsToDegs(ll.lng))};
}

}

HexGrid::HexGrid(int resolution)
    : resolution_(resolution), edge_km_(0.0) {
    if (resolution < 0 || resolution > kMaxResolution) {
        throw ConfigurationError("hex resolution must be in [0, " + std::to_string(kMaxResolution) +
                                 "] (got " + std::to_string(resolution) + ")");
    }
    edge_km_ = edgeLengthKm(resolution);
}

double HexGrid::edgeLengthKm(int resolution) {
    double km = 0.0;
    if (H3Error err = getHexagonEdgeLengthAvgKm(resolution, &km); err != E_SUCCESS) {
        throw std::invalid_argument(errorText("getHexagonEdgeLengthAvgKm", err) +
                                    " for resolution " + std::to_string(resolution));
    }
    return km;
}

int HexGrid::resolutionOf(CellId id) {
    if (!isValidCell(static_cast<H3Index>(id))) {
        throw std::invalid_argument("not a valid cell index: " + std::to_string(id));
    }
    return getResolution(static_cast<H3Index>(id));
}

void HexGrid::checkOwnership(CellId id) const {
    const int level = resolutionOf(id);
    if (level != resolution_) {
        throw std::invalid_argument("cell " + std::to_string(id) + " belongs to level " +
                                    std::to_string(level) + ", grid is level " +
                                    std::to_string(resolution_));
    }
}

CellId HexGrid::cellFor(double lat, double lon) const {
    LatLng ll;
    ll.lat = degsToRads(lat);
    ll.lng = degsToRads(lon);
    H3Index cell = 0;
    if (H3Error err = latLngToCell(&ll, resolution_, &cell); err != E_SUCCESS) {
        throw std::invalid_argument(errorText("latLngToCell", err) + " at (" +
                                    std::to_string(lat) + ", " + std::to_string(lon) + ")");
    }
    return static_cast<CellId>(cell);
}

GeoPoint HexGrid::cellCenter(CellId id) const {
    checkOwnership(id);
    LatLng ll;
    if (H3Error err = cellToLatLng(static_cast<H3Index>(id), &ll); err != E_SUCCESS) {
        throw std::invalid_argument(errorText("cellToLatLng", err));
    }
    return toGeoPoint(ll);
}

std::vector<GeoPoint> HexGrid::cellBoundary(CellId id) const {
    checkOwnership(id);
    CellBoundary boundary;
    if (H3Error err = cellToBoundary(static_cast<H3Index>(id), &boundary); err != E_SUCCESS) {
        throw std::invalid_argument(errorText("cellToBoundary", err));
    }
    std::vector<GeoPoint> corners;
    corners.reserve(static_cast<std::size_t>(boundary.numVerts));
    for (int i = 0; i < boundary.numVerts; ++i) {
        corners.push_back(toGeoPoint(boundary.verts[i]));
    }
    return corners;
}

int HexGrid::gridDistance(CellId a, CellId b) const {
    checkOwnership(a);
    checkOwnership(b);
    std::int64_t steps = 0;
    if (::gridDistance(static_cast<H3Index>(a), static_cast<H3Index>(b), &steps) != E_SUCCESS) {
        return -1;
    }
    return static_cast<int>(steps);
}

std::vector<HexCell> HexGrid::indexBin(const TimeBin& bin, const SampleStore& store) const {
    std::map<CellId, std::vector<std::uint32_t>> groups;
    for (auto row : bin.members) {
        if (row >= store.size()) {
            throw InputInconsistencyError("time bin " + std::to_string(bin.index) +
                                          " references sample " + std::to_string(row) +
                                          " but only " + std::to_string(store.size()) + " exist",
                                          {row});
        }
        const Sample& s = store.sample(row);
        groups[cellFor(s.lat, s.lon)].push_back(row);
    }

    std::vector<HexCell> cells;
    cells.reserve(groups.size());
    for (auto& [id, members] : groups) {
        HexCell cell;
        cell.id = id;
        cell.bin = bin.index;
        GeoPoint center = cellCenter(id);
        cell.centerLat = center.lat;
        cell.centerLon = center.lon;
        std::sort(members.begin(), members.end());
        cell.members = std::move(members);
        cells.push_back(std::move(cell));
    }
    return cells;
}
