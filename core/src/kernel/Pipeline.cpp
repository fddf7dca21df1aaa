#include "kernel/Pipeline.h"
#include "kernel/Errors.h"
#include <chrono>
#include <cmath>
#include <exception>
#include <omp.h>

void validateConfig(const PipelineConfig& cfg) {
    if (cfg.binCount < 1) {
        throw ConfigurationError("bin_count must be >= 1 (got " + std::to_string(cfg.binCount) + ")");
    }
    if (cfg.hexResolution < 0 || cfg.hexResolution > HexGrid::kMaxResolution) {
        throw ConfigurationError("hex_resolution must be in [0, " + std::to_string(HexGrid::kMaxResolution) +
                                 "] (got " + std::to_string(cfg.hexResolution) + ")");
    }
    if (!(cfg.lowessBandwidth > 0.0 && cfg.lowessBandwidth <= 1.0)) {
        throw ConfigurationError("lowess_bandwidth must be in (0, 1] (got " +
                                 std::to_string(cfg.lowessBandwidth) + ")");
    }
    if (!(cfg.barrierThreshold > 1.0) || !std::isfinite(cfg.barrierThreshold)) {
        throw ConfigurationError("barrier_threshold must be > 1 (got " +
                                 std::to_string(cfg.barrierThreshold) + ")");
    }
    if (!(cfg.corridorThreshold > 0.0 && cfg.corridorThreshold < 1.0)) {
        throw ConfigurationError("corridor_threshold must be in (0, 1) (got " +
                                 std::to_string(cfg.corridorThreshold) + ")");
    }
    if (cfg.lowessIterations < 0) {
        throw ConfigurationError("lowess_iterations must be >= 0 (got " +
                                 std::to_string(cfg.lowessIterations) + ")");
    }
    if (!(cfg.isolatedThreshold >= 0.0) || !std::isfinite(cfg.isolatedThreshold)) {
        throw ConfigurationError("isolated_threshold must be >= 0 (got " +
                                 std::to_string(cfg.isolatedThreshold) + ")");
    }
    if (!(cfg.maxEdgeKm >= 0.0) || !std::isfinite(cfg.maxEdgeKm)) {
        throw ConfigurationError("max_edge_km must be >= 0 (got " + std::to_string(cfg.maxEdgeKm) + ")");
    }
    if (cfg.threads < 0) {
        throw ConfigurationError("threads must be >= 0 (got " + std::to_string(cfg.threads) + ")");
    }
}

ScoringParams scoringParams(const PipelineConfig& cfg) {
    ScoringParams p;
    p.bandwidth = cfg.lowessBandwidth;
    p.barrierThreshold = cfg.barrierThreshold;
    p.corridorThreshold = cfg.corridorThreshold;
    p.robustIterations = cfg.lowessIterations;
    p.monotone = cfg.monotoneFit;
    return p;
}

PipelineStatistics computeStatistics(const PipelineResult& result) {
    PipelineStatistics stats;
    stats.samples = result.sampleCount;
    stats.bins = result.bins.size();

    double genetic_sum = 0.0;
    double geo_sum = 0.0;
    for (const auto& b : result.bins) {
        if (b.bin.members.empty()) ++stats.emptyBins;
        if (b.fit.fitted) ++stats.fittedBins;
        stats.cells += b.cells.size();
        stats.edges += b.edges.size();
        stats.barriers += b.fit.barriers;
        stats.corridors += b.fit.corridors;
        stats.unconnectedCells += b.unconnectedCells.size();
        stats.isolatedCells += b.isolated.size();
        for (const auto& e : b.edges) {
            genetic_sum += e.geneticDistance;
            geo_sum += e.geoDistanceKm;
        }
    }
    if (stats.edges > 0) {
        stats.meanGeneticDistance = genetic_sum / stats.edges;
        stats.meanGeoDistanceKm = geo_sum / stats.edges;
    }
    return stats;
}

// ---------- ResultSlot ----------
bool ResultSlot::publish(std::shared_ptr<const PipelineResult> result) {
    if (!result) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ && current_->requestId > result->requestId) {
        return false;
    }
    current_ = std::move(result);
    return true;
}

std::shared_ptr<const PipelineResult> ResultSlot::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

// ---------- Pipeline ----------
Pipeline::Pipeline(std::shared_ptr<const SampleStore> store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("pipeline needs a sample store");
    }
}

RecomputeRequest Pipeline::makeRequest(const PipelineConfig& cfg) {
    RecomputeRequest request;
    request.id = latest_request_.fetch_add(1, std::memory_order_acq_rel) + 1;
    request.config = cfg;
    return request;
}

bool Pipeline::superseded(const RecomputeRequest& request) const {
    return request.id < latest_request_.load(std::memory_order_acquire);
}

BinResult Pipeline::computeBin(const TimeBin& bin, const PipelineConfig& cfg, const HexGrid& grid,
                               const NeighborGraphBuilder& graphBuilder, const BarrierScorer& scorer,
                               const IsolationDetector& isolation) const {
    BinResult out;
    out.bin = bin;
    out.cells = grid.indexBin(bin, *store_);

    NeighborTopology topology = graphBuilder.build(out.cells);
    out.topology = topologyName(topology);

    std::vector<NeighborEdge> edges =
        NeighborGraphBuilder::pruneLongEdges(topologyEdges(topology), out.cells, cfg.maxEdgeKm);
    out.unconnectedCells = NeighborGraphBuilder::unconnectedCells(out.cells.size(), edges);

    DistanceAggregator aggregator(*store_);
    out.edges = aggregator.aggregate(out.cells, edges, &grid);
    out.fit = scorer.score(out.edges);
    out.isolated = isolation.detect(out.cells, out.edges, out.fit, aggregator);
    return out;
}

std::shared_ptr<const PipelineResult> Pipeline::compute(const RecomputeRequest& request) const {
    const PipelineConfig& cfg = request.config;
    validateConfig(cfg);

    const auto started = std::chrono::steady_clock::now();

    TimeBinner binner(cfg.binCount, cfg.binning);
    HexGrid grid(cfg.hexResolution);
    NeighborGraphBuilder graphBuilder(TuningConstants::kCenterMergeToleranceKm);
    BarrierScorer scorer(scoringParams(cfg));
    IsolationDetector isolation(cfg.isolatedThreshold);

    std::vector<TimeBin> bins = binner.partition(*store_);

    auto result = std::make_shared<PipelineResult>();
    result->requestId = request.id;
    result->config = cfg;
    result->sampleCount = store_->size();
    result->bins.resize(bins.size());

    std::vector<std::exception_ptr> failures(bins.size());
    const int thread_count = cfg.threads > 0 ? cfg.threads : omp_get_max_threads();
    const long bin_count = static_cast<long>(bins.size());

    // Bins share nothing mutable; failures are collected and rethrown after the join
    #pragma omp parallel for schedule(dynamic) num_threads(thread_count)
    for (long b = 0; b < bin_count; ++b) {
        if (superseded(request)) continue;
        try {
            result->bins[b] = computeBin(bins[b], cfg, grid, graphBuilder, scorer, isolation);
        } catch (...) {
            failures[b] = std::current_exception();
        }
    }

    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }
    if (superseded(request)) {
        return nullptr;
    }

    result->elapsedMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();
    return result;
}

std::shared_ptr<const PipelineResult> Pipeline::submit(const PipelineConfig& cfg) {
    validateConfig(cfg);
    RecomputeRequest request = makeRequest(cfg);
    auto result = compute(request);
    if (result) {
        slot_.publish(result);
    }
    return result;
}
