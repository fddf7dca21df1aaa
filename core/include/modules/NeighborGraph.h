#ifndef NEIGHBOR_GRAPH_H
#define NEIGHBOR_GRAPH_H

#include <array>
#include <cstdint>
#include <variant>
#include <vector>

#include "modules/Geodesy.h"
#include "modules/HexGrid.h"

// Unordered pair of cells of one bin, stored as indices into the bin's cell
// list with a < b.
struct NeighborEdge {
    std::uint32_t a = 0;
    std::uint32_t b = 0;

    bool operator==(const NeighborEdge& o) const { return a == o.a && b == o.b; }
    bool operator<(const NeighborEdge& o) const { return a < o.a || (a == o.a && b < o.b); }
};

// ---------- Neighbor topologies ----------
struct NoPoints {};

struct SinglePoint {
    std::uint32_t cell = 0;
};

// Triangulation is undefined below three points: the pair is joined directly
struct TwoPoints {
    NeighborEdge edge;
};

// All centers on one line: consecutive points along the line are joined
struct CollinearChain {
    std::vector<NeighborEdge> edges;
};

struct TriangulatedGraph {
    std::vector<NeighborEdge> edges;
    std::vector<std::array<std::uint32_t, 3>> triangles;
};

using NeighborTopology = std::variant<NoPoints, SinglePoint, TwoPoints, CollinearChain, TriangulatedGraph>;

// Sorted, duplicate-free edge list of any topology
std::vector<NeighborEdge> topologyEdges(const NeighborTopology& topology);
const char* topologyName(const NeighborTopology& topology);

/**
 * Adjacency between the occupied cells of one time bin.
 *
 * Occupied cells are sparse and irregular, so ring adjacency on the hex grid
 * would leave most of them unconnected. Instead the cell centers are projected
 * to a local plane (azimuthal equidistant about their spherical mean) and
 * Delaunay-triangulated with Bowyer-Watson; triangle sides become edges.
 *
 * Degenerate inputs never reach the triangulator:
 *   0 cells     -> NoPoints
 *   1 cell      -> SinglePoint
 *   2 cells     -> TwoPoints
 *   collinear   -> CollinearChain
 * Centers closer than the merge tolerance collapse onto one representative,
 * which gets an edge to each duplicate.
 */
class NeighborGraphBuilder {
public:
    explicit NeighborGraphBuilder(double mergeToleranceKm = 1e-6);

    NeighborTopology build(const std::vector<HexCell>& cells) const;
    NeighborTopology buildFromPoints(const std::vector<PlanarPoint>& points) const;

    // Drops edges whose great-circle length exceeds maxKm (maxKm <= 0 keeps all)
    static std::vector<NeighborEdge> pruneLongEdges(const std::vector<NeighborEdge>& edges,
                                                    const std::vector<HexCell>& cells,
                                                    double maxKm);

    // Cells that appear in no edge
    static std::vector<std::uint32_t> unconnectedCells(std::size_t cellCount,
                                                    const std::vector<NeighborEdge>& edges);

private:
    double merge_tolerance_km_;

    std::vector<std::array<std::uint32_t, 3>> triangulate(const std::vector<PlanarPoint>& points) const;
};

#endif
