#ifndef PIPELINE_H
#define PIPELINE_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kernel/SampleStore.h"
#include "modules/BarrierScorer.h"
#include "modules/DistanceAggregator.h"
#include "modules/HexGrid.h"
#include "modules/IsolationDetector.h"
#include "modules/NeighborGraph.h"
#include "modules/TimeBinner.h"

// ---------- Tuning Constants ----------
namespace TuningConstants {
    // Projected cell centers closer than this are treated as one point
    constexpr double kCenterMergeToleranceKm = 1e-6;

    // Defaults: 14 bins, level 3 cells
    constexpr std::uint32_t kDefaultBinCount = 14;
    constexpr int kDefaultResolution = 3;
    constexpr double kDefaultBandwidth = 2.0 / 3.0;
    constexpr double kDefaultBarrierThreshold = 1.5;
    constexpr double kDefaultCorridorThreshold = 0.67;
    constexpr int kDefaultRobustIterations = 3;
    // A cell whose every link reaches this ratio is an isolated population
    constexpr double kDefaultIsolatedThreshold = 1.5;
}

// ---------- Configuration ----------
struct PipelineConfig {
    std::uint32_t binCount = TuningConstants::kDefaultBinCount;
    int hexResolution = TuningConstants::kDefaultResolution;
    double lowessBandwidth = TuningConstants::kDefaultBandwidth;
    double barrierThreshold = TuningConstants::kDefaultBarrierThreshold;
    double corridorThreshold = TuningConstants::kDefaultCorridorThreshold;
    BinningMode binning = BinningMode::EqualWidth;
    int lowessIterations = TuningConstants::kDefaultRobustIterations;
    bool monotoneFit = true;
    double isolatedThreshold = TuningConstants::kDefaultIsolatedThreshold;
    double maxEdgeKm = 0.0;     // 0 keeps every triangulation edge
    int threads = 0;            // 0 = OpenMP default
};

// Throws ConfigurationError naming the first out-of-domain field
void validateConfig(const PipelineConfig& cfg);

ScoringParams scoringParams(const PipelineConfig& cfg);

// One recomputation. Ids grow monotonically; a request is superseded as soon
// as a newer one has been issued by the same pipeline.
struct RecomputeRequest {
    std::uint64_t id = 0;
    PipelineConfig config;
};

struct BinResult {
    TimeBin bin;
    std::vector<HexCell> cells;
    std::string topology;                   // none, single, pair, collinear, triangulated
    std::vector<EdgeMetrics> edges;
    std::vector<std::uint32_t> unconnectedCells;   // no edge left, indices into cells
    FitSummary fit;
    std::vector<IsolatedCell> isolated;
};

struct PipelineResult {
    std::uint64_t requestId = 0;
    PipelineConfig config;
    std::vector<BinResult> bins;
    std::size_t sampleCount = 0;
    double elapsedMs = 0.0;
};

struct PipelineStatistics {
    std::size_t samples = 0;
    std::size_t bins = 0;
    std::size_t emptyBins = 0;
    std::size_t fittedBins = 0;
    std::size_t cells = 0;
    std::size_t edges = 0;
    std::size_t barriers = 0;
    std::size_t corridors = 0;
    std::size_t unconnectedCells = 0;
    std::size_t isolatedCells = 0;
    double meanGeneticDistance = 0.0;
    double meanGeoDistanceKm = 0.0;
};

PipelineStatistics computeStatistics(const PipelineResult& result);

/**
 * Latest published result, handed to readers as an immutable snapshot.
 *
 * Single writer, many readers. A result never replaces one produced by a
 * newer request.
 */
class ResultSlot {
public:
    bool publish(std::shared_ptr<const PipelineResult> result);
    std::shared_ptr<const PipelineResult> current() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const PipelineResult> current_;
};

/**
 * Spatio-temporal barrier pipeline.
 *
 *   TimeBinner -> HexGrid -> NeighborGraphBuilder -> DistanceAggregator -> BarrierScorer
 *     -> IsolationDetector
 *
 * Bins only share the read-only SampleStore, so they run in parallel
 * (OpenMP) and every request builds its own derived data. A request that
 * is superseded mid-flight stops scheduling bins and yields no result.
 */
class Pipeline {
public:
    explicit Pipeline(std::shared_ptr<const SampleStore> store);

    RecomputeRequest makeRequest(const PipelineConfig& cfg);

    // Null when the request was superseded before it finished
    std::shared_ptr<const PipelineResult> compute(const RecomputeRequest& request) const;

    // makeRequest + compute + publish
    std::shared_ptr<const PipelineResult> submit(const PipelineConfig& cfg);

    bool superseded(const RecomputeRequest& request) const;
    std::shared_ptr<const PipelineResult> current() const { return slot_.current(); }

private:
    std::shared_ptr<const SampleStore> store_;
    std::atomic<std::uint64_t> latest_request_{0};
    ResultSlot slot_;

    BinResult computeBin(const TimeBin& bin, const PipelineConfig& cfg, const HexGrid& grid,
                         const NeighborGraphBuilder& graphBuilder, const BarrierScorer& scorer,
                         const IsolationDetector& isolation) const;
};

#endif // PIPELINE_H
