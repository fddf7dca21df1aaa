#include <gtest/gtest.h>
#include "kernel/Errors.h"
#include "kernel/SampleStore.h"
#include "modules/IsolationDetector.h"

namespace {

// Cells A{0,1} B{2} C{3} D{4}; A is closest to D although they share no edge
SampleStore fiveSampleStore() {
    std::vector<Sample> samples = {
        {"a0", 0.0, 0.0, 100},
        {"a1", 0.0, 0.0, 100},
        {"b0", 1.0, 0.0, 100},
        {"c0", 0.0, 1.5, 100},
        {"d0", 0.0, 3.0, 100},
    };
    auto m = DistanceMatrix::fromRows({
        {0.0, 0.1, 0.6, 0.5, 0.3},
        {0.1, 0.0, 0.6, 0.7, 0.3},
        {0.6, 0.6, 0.0, 0.2, 0.4},
        {0.5, 0.7, 0.2, 0.0, 0.2},
        {0.3, 0.3, 0.4, 0.2, 0.0},
    });
    return SampleStore(samples, m);
}

HexCell makeCell(CellId id, double lat, double lon, std::vector<std::uint32_t> members) {
    HexCell c;
    c.id = id;
    c.centerLat = lat;
    c.centerLon = lon;
    c.members = std::move(members);
    return c;
}

std::vector<HexCell> fourCells() {
    return {
        makeCell(10, 0.0, 0.0, {0, 1}),
        makeCell(20, 1.0, 0.0, {2}),
        makeCell(30, 0.0, 1.5, {3}),
        makeCell(40, 0.0, 3.0, {4}),
    };
}

EdgeMetrics scoredEdge(std::uint32_t a, std::uint32_t b, double scaled) {
    EdgeMetrics e;
    e.edge = {a, b};
    e.scaledDistance = scaled;
    return e;
}

FitSummary fittedSummary() {
    FitSummary fit;
    fit.fitted = true;
    return fit;
}

}

// Only a cell whose every link reaches the threshold is isolated
TEST(IsolationDetectorTest, FlagsCellCutOffFromAllNeighbors) {
    SampleStore store = fiveSampleStore();
    DistanceAggregator aggregator(store);
    auto cells = fourCells();
    std::vector<EdgeMetrics> edges = {
        scoredEdge(0, 1, 2.0), scoredEdge(0, 2, 1.8), scoredEdge(1, 2, 1.0), scoredEdge(2, 3, 0.9),
    };

    auto isolated = IsolationDetector(1.5).detect(cells, edges, fittedSummary(), aggregator);

    ASSERT_EQ(isolated.size(), 1u);
    const IsolatedCell& iso = isolated[0];
    EXPECT_EQ(iso.cell, 0u);
    EXPECT_EQ(iso.edges, 2u);
    EXPECT_DOUBLE_EQ(iso.minScaledDistance, 1.8);
}

// The closest population is searched over every cell, neighbor or not
TEST(IsolationDetectorTest, ReportsClosestPopulationAndInternalDistance) {
    SampleStore store = fiveSampleStore();
    DistanceAggregator aggregator(store);
    auto cells = fourCells();
    std::vector<EdgeMetrics> edges = {scoredEdge(0, 1, 2.0), scoredEdge(0, 2, 1.8), scoredEdge(2, 3, 0.9)};

    auto isolated = IsolationDetector(1.5).detect(cells, edges, fittedSummary(), aggregator);

    ASSERT_EQ(isolated.size(), 1u);
    const IsolatedCell& iso = isolated[0];
    EXPECT_EQ(iso.closestCell, 3);
    EXPECT_NEAR(iso.closestDistance, 0.3, 1e-12);
    EXPECT_NEAR(iso.closestGeoKm, 333.585, 0.01);
    EXPECT_NEAR(iso.internalDistance, 0.1, 1e-12);
    EXPECT_EQ(iso.internalPairs, 1u);
}

// A link exactly at the threshold counts as cut
TEST(IsolationDetectorTest, ThresholdIsInclusive) {
    SampleStore store = fiveSampleStore();
    DistanceAggregator aggregator(store);
    auto cells = fourCells();
    std::vector<EdgeMetrics> edges = {scoredEdge(0, 3, 1.5), scoredEdge(1, 2, 0.5)};

    auto isolated = IsolationDetector(1.5).detect(cells, edges, fittedSummary(), aggregator);
    ASSERT_EQ(isolated.size(), 2u);
    EXPECT_EQ(isolated[0].cell, 0u);
    EXPECT_EQ(isolated[1].cell, 3u);

    // Single-member cell has no internal pairs
    EXPECT_EQ(isolated[1].internalPairs, 0u);
    EXPECT_DOUBLE_EQ(isolated[1].internalDistance, 0.0);
}

// Cells without edges are unconnected, not isolated
TEST(IsolationDetectorTest, IgnoresCellsWithoutEdges) {
    SampleStore store = fiveSampleStore();
    DistanceAggregator aggregator(store);
    auto cells = fourCells();
    std::vector<EdgeMetrics> edges = {scoredEdge(1, 2, 0.8)};
    EXPECT_EQ(IsolationDetector(0.5).detect(cells, edges, fittedSummary(), aggregator).size(), 2u);
    EXPECT_TRUE(IsolationDetector(1.5).detect(cells, {}, fittedSummary(), aggregator).empty());
}

// Placeholder ratios of an unfitted bin never flag anything
TEST(IsolationDetectorTest, UnfittedBinYieldsNothing) {
    SampleStore store = fiveSampleStore();
    DistanceAggregator aggregator(store);
    auto cells = fourCells();
    std::vector<EdgeMetrics> edges = {scoredEdge(0, 1, 1.0), scoredEdge(2, 3, 1.0)};
    EXPECT_TRUE(IsolationDetector(1.0).detect(cells, edges, FitSummary{}, aggregator).empty());
}

TEST(IsolationDetectorTest, RejectsBadInput) {
    EXPECT_THROW(IsolationDetector(-0.1), ConfigurationError);

    SampleStore store = fiveSampleStore();
    DistanceAggregator aggregator(store);
    auto cells = fourCells();
    std::vector<EdgeMetrics> edges = {scoredEdge(0, 7, 2.0)};
    EXPECT_THROW(IsolationDetector(1.5).detect(cells, edges, fittedSummary(), aggregator),
                 InputInconsistencyError);
}
