#ifndef ISOLATION_DETECTOR_H
#define ISOLATION_DETECTOR_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "modules/BarrierScorer.h"
#include "modules/DistanceAggregator.h"
#include "modules/HexGrid.h"

struct IsolatedCell {
    std::uint32_t cell = 0;             // index into the bin's cells
    std::size_t edges = 0;              // incident edges, all at or above the threshold
    double minScaledDistance = 0.0;     // weakest tie to a neighbor
    double internalDistance = 0.0;      // mean over member pairs, 0 with one member
    std::size_t internalPairs = 0;
    std::int64_t closestCell = -1;      // genetically closest other cell of the bin
    double closestDistance = 0.0;       // all-pairs mean to that cell
    double closestGeoKm = 0.0;
};

/**
 * Populations cut off from every neighbor.
 *
 * A cell is isolated when it has at least one edge and the scaled distance
 * of each of its edges is >= threshold. For each such cell the genetically
 * closest population is searched over every other occupied cell of the bin
 * (not only neighbors), ties going to the lower cell index.
 *
 * Bins without a fitted curve carry placeholder ratios and yield nothing.
 */
class IsolationDetector {
public:
    explicit IsolationDetector(double threshold);

    std::vector<IsolatedCell> detect(const std::vector<HexCell>& cells,
                                     const std::vector<EdgeMetrics>& edges,
                                     const FitSummary& fit,
                                     const DistanceAggregator& aggregator) const;

private:
    double threshold_;
};

#endif
