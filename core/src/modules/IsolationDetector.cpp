#include "modules/IsolationDetector.h"
#include "kernel/Errors.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

IsolationDetector::IsolationDetector(double threshold) : threshold_(threshold) {
    if (!(threshold >= 0.0) || !std::isfinite(threshold)) {
        throw ConfigurationError("isolation threshold must be >= 0 (got " + std::to_string(threshold) + ")");
    }
}

std::vector<IsolatedCell> IsolationDetector::detect(const std::vector<HexCell>& cells,
                                                    const std::vector<EdgeMetrics>& edges,
                                                    const FitSummary& fit,
                                                    const DistanceAggregator& aggregator) const {
    std::vector<IsolatedCell> isolated;
    if (!fit.fitted) return isolated;

    std::vector<std::size_t> degree(cells.size(), 0);
    std::vector<bool> tied(cells.size(), false);
    std::vector<double> weakest(cells.size(), std::numeric_limits<double>::infinity());
    for (const auto& e : edges) {
        for (std::uint32_t end : {e.edge.a, e.edge.b}) {
            if (end >= cells.size()) {
                throw InputInconsistencyError("edge references cell " + std::to_string(end) +
                                              " outside the bin's " + std::to_string(cells.size()) + " cells",
                                              {end});
            }
            ++degree[end];
            weakest[end] = std::min(weakest[end], e.scaledDistance);
            if (e.scaledDistance < threshold_) tied[end] = true;
        }
    }

    for (std::uint32_t i = 0; i < cells.size(); ++i) {
        if (degree[i] == 0 || tied[i]) continue;

        IsolatedCell iso;
        iso.cell = i;
        iso.edges = degree[i];
        iso.minScaledDistance = weakest[i];
        iso.internalDistance = aggregator.internalDistance(cells[i], &iso.internalPairs);

        for (std::uint32_t j = 0; j < cells.size(); ++j) {
            if (j == i) continue;
            EdgeMetrics m = aggregator.aggregatePair(cells[i], cells[j]);
            if (iso.closestCell < 0 || m.geneticDistance < iso.closestDistance) {
                iso.closestCell = j;
                iso.closestDistance = m.geneticDistance;
                iso.closestGeoKm = m.geoDistanceKm;
            }
        }
        isolated.push_back(iso);
    }
    return isolated;
}
