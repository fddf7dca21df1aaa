#ifndef DISTANCE_AGGREGATOR_H
#define DISTANCE_AGGREGATOR_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "modules/HexGrid.h"
#include "modules/NeighborGraph.h"

class SampleStore;

enum class EdgeClass {
    Unset,
    Normal,
    Barrier,    // genetic distance high for the separation: restricted gene flow
    Corridor    // genetic distance low for the separation: migration route
};

const char* edgeClassName(EdgeClass c);

struct EdgeMetrics {
    NeighborEdge edge;
    CellId cellA = 0;
    CellId cellB = 0;
    double geoDistanceKm = 0.0;
    double geneticDistance = 0.0;
    double normalizedDistance = 0.0;   // min-max over the bin, [0, 1]
    double scaledDistance = 1.0;
    EdgeClass classification = EdgeClass::Unset;
    std::size_t pairCount = 0;         // sample pairs averaged
    int gridSteps = 0;                 // hex steps between the two cells
};

/**
 * Hexagon-pair distances for the edges of one time bin.
 *
 * geo distance     = great-circle distance between the two cell centers
 * genetic distance = mean over every (member of a, member of b) pair
 *
 * The all-pairs mean keeps a single outlying sample from dominating a cell.
 * Sums always run from the lower cell id to the higher one, so swapping the
 * two cells reproduces the result bit for bit.
 */
class DistanceAggregator {
public:
    explicit DistanceAggregator(const SampleStore& store);

    std::vector<EdgeMetrics> aggregate(const std::vector<HexCell>& cells,
                                       const std::vector<NeighborEdge>& edges,
                                       const HexGrid* grid = nullptr) const;

    // Single pair, classification left unset
    EdgeMetrics aggregatePair(const HexCell& a, const HexCell& b) const;

    // Mean distance over the cell's own member pairs; 0 with a single member
    double internalDistance(const HexCell& cell, std::size_t* pairCount = nullptr) const;

    // Min-max normalization of genetic distance across one bin's edges
    static void normalize(std::vector<EdgeMetrics>& edges);

private:
    const SampleStore& store_;

    void checkCell(const HexCell& cell) const;
};

#endif
