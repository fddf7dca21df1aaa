#include "modules/DistanceAggregator.h"
#include "kernel/Errors.h"
#include "kernel/SampleStore.h"
#include <algorithm>
#include <string>

const char* edgeClassName(EdgeClass c) {
    switch (c) {
        case EdgeClass::Unset: return "unset";
        case EdgeClass::Normal: return "normal";
        case EdgeClass::Barrier: return "barrier";
        case EdgeClass::Corridor: return "corridor";
    }
    return "unset";
}

DistanceAggregator::DistanceAggregator(const SampleStore& store) : store_(store) {}

void DistanceAggregator::checkCell(const HexCell& cell) const {
    if (cell.members.empty()) {
        throw InputInconsistencyError("cell " + std::to_string(cell.id) + " in bin " +
                                      std::to_string(cell.bin) + " has no member samples");
    }
    std::vector<std::size_t> missing;
    for (auto m : cell.members) {
        if (m >= store_.size()) missing.push_back(m);
    }
    if (!missing.empty()) {
        throw InputInconsistencyError("cell " + std::to_string(cell.id) + " references " +
                                      std::to_string(missing.size()) + " sample(s) outside the store",
                                      std::move(missing));
    }
}

EdgeMetrics DistanceAggregator::aggregatePair(const HexCell& a, const HexCell& b) const {
    checkCell(a);
    checkCell(b);

    // Canonical order: lower cell id drives the outer loop
    const HexCell& first = (a.id <= b.id) ? a : b;
    const HexCell& second = (a.id <= b.id) ? b : a;

    double sum = 0.0;
    for (auto i : first.members) {
        for (auto j : second.members) {
            sum += store_.distance(i, j);
        }
    }

    EdgeMetrics m;
    m.cellA = a.id;
    m.cellB = b.id;
    m.pairCount = first.members.size() * second.members.size();
    m.geneticDistance = sum / static_cast<double>(m.pairCount);
    m.geoDistanceKm = haversineKm({first.centerLat, first.centerLon}, {second.centerLat, second.centerLon});
    return m;
}

double DistanceAggregator::internalDistance(const HexCell& cell, std::size_t* pairCount) const {
    checkCell(cell);
    double sum = 0.0;
    std::size_t pairs = 0;
    for (std::size_t i = 0; i < cell.members.size(); ++i) {
        for (std::size_t j = i + 1; j < cell.members.size(); ++j) {
            sum += store_.distance(cell.members[i], cell.members[j]);
            ++pairs;
        }
    }
    if (pairCount) *pairCount = pairs;
    return pairs > 0 ? sum / static_cast<double>(pairs) : 0.0;
}

std::vector<EdgeMetrics> DistanceAggregator::aggregate(const std::vector<HexCell>& cells,
                                                       const std::vector<NeighborEdge>& edges,
                                                       const HexGrid* grid) const {
    std::vector<EdgeMetrics> result;
    result.reserve(edges.size());

    for (const auto& e : edges) {
        if (e.a >= cells.size() || e.b >= cells.size()) {
            throw InputInconsistencyError("edge (" + std::to_string(e.a) + "," + std::to_string(e.b) +
                                          ") references a cell outside the bin's " +
                                          std::to_string(cells.size()) + " cells",
                                          {e.a, e.b});
        }
        EdgeMetrics m = aggregatePair(cells[e.a], cells[e.b]);
        m.edge = e;
        if (grid) {
            m.gridSteps = grid->gridDistance(m.cellA, m.cellB);
        }
        result.push_back(m);
    }

    normalize(result);
    return result;
}

void DistanceAggregator::normalize(std::vector<EdgeMetrics>& edges) {
    if (edges.empty()) return;
    auto [lo, hi] = std::minmax_element(edges.begin(), edges.end(),
        [](const EdgeMetrics& x, const EdgeMetrics& y) { return x.geneticDistance < y.geneticDistance; });
    const double min_d = lo->geneticDistance;
    const double range = hi->geneticDistance - min_d;
    for (auto& e : edges) {
        e.normalizedDistance = (range > 0.0) ? (e.geneticDistance - min_d) / range : 0.0;
    }
}
