#include "io/Snapshot.h"
#include <iomanip>
#include <ostream>
#include <sstream>

namespace {

void writeConfig(std::ostream& os, const PipelineConfig& cfg) {
    os << "\"config\":{";
    os << "\"binCount\":" << cfg.binCount << ",";
    os << "\"hexResolution\":" << cfg.hexResolution << ",";
    os << "\"binning\":\"" << binningModeName(cfg.binning) << "\",";
    os << "\"lowessBandwidth\":" << cfg.lowessBandwidth << ",";
    os << "\"lowessIterations\":" << cfg.lowessIterations << ",";
    os << "\"monotoneFit\":" << (cfg.monotoneFit ? "true" : "false") << ",";
    os << "\"barrierThreshold\":" << cfg.barrierThreshold << ",";
    os << "\"corridorThreshold\":" << cfg.corridorThreshold << ",";
    os << "\"isolatedThreshold\":" << cfg.isolatedThreshold << ",";
    os << "\"maxEdgeKm\":" << cfg.maxEdgeKm;
    os << "}";
}

void writeBin(std::ostream& os, const BinResult& b, const HexGrid& grid, bool includeBoundaries) {
    os << "{";
    os << "\"index\":" << b.bin.index << ",";
    os << "\"ageMin\":" << b.bin.ageMin << ",";
    os << "\"ageMax\":" << b.bin.ageMax << ",";
    os << "\"label\":\"" << formatAgeLabel(b.bin.ageMin, b.bin.ageMax) << "\",";
    os << "\"samples\":" << b.bin.members.size() << ",";
    os << "\"topology\":\"" << b.topology << "\",";

    os << "\"cells\":[";
    for (std::size_t i = 0; i < b.cells.size(); ++i) {
        const auto& c = b.cells[i];
        os << "{";
        os << "\"id\":\"" << cellIdToString(c.id) << "\",";
        os << "\"center\":[" << c.centerLat << "," << c.centerLon << "],";
        os << "\"members\":[";
        for (std::size_t m = 0; m < c.members.size(); ++m) {
            os << c.members[m];
            if (m + 1 < c.members.size()) os << ",";
        }
        os << "]";
        if (includeBoundaries) {
            os << ",\"boundary\":[";
            auto corners = grid.cellBoundary(c.id);
            for (std::size_t k = 0; k < corners.size(); ++k) {
                os << "[" << corners[k].lat << "," << corners[k].lon << "]";
                if (k + 1 < corners.size()) os << ",";
            }
            os << "]";
        }
        os << "}";
        if (i + 1 < b.cells.size()) os << ",";
    }
    os << "],";

    os << "\"edges\":[";
    for (std::size_t i = 0; i < b.edges.size(); ++i) {
        const auto& e = b.edges[i];
        os << "{";
        os << "\"a\":\"" << cellIdToString(e.cellA) << "\",";
        os << "\"b\":\"" << cellIdToString(e.cellB) << "\",";
        os << "\"geoKm\":" << e.geoDistanceKm << ",";
        os << "\"genetic\":" << e.geneticDistance << ",";
        os << "\"normalized\":" << e.normalizedDistance << ",";
        os << "\"scaled\":" << e.scaledDistance << ",";
        os << "\"steps\":" << e.gridSteps << ",";
        os << "\"class\":\"" << edgeClassName(e.classification) << "\"";
        os << "}";
        if (i + 1 < b.edges.size()) os << ",";
    }
    os << "],";

    os << "\"unconnected\":[";
    for (std::size_t i = 0; i < b.unconnectedCells.size(); ++i) {
        os << "\"" << cellIdToString(b.cells[b.unconnectedCells[i]].id) << "\"";
        if (i + 1 < b.unconnectedCells.size()) os << ",";
    }
    os << "],";

    os << "\"isolated\":[";
    for (std::size_t i = 0; i < b.isolated.size(); ++i) {
        const auto& iso = b.isolated[i];
        os << "{";
        os << "\"id\":\"" << cellIdToString(b.cells[iso.cell].id) << "\",";
        os << "\"edges\":" << iso.edges << ",";
        os << "\"minScaled\":" << iso.minScaledDistance << ",";
        os << "\"internal\":" << iso.internalDistance << ",";
        os << "\"internalPairs\":" << iso.internalPairs << ",";
        if (iso.closestCell >= 0) {
            os << "\"closest\":\"" << cellIdToString(b.cells[iso.closestCell].id) << "\",";
        } else {
            os << "\"closest\":null,";
        }
        os << "\"closestGenetic\":" << iso.closestDistance << ",";
        os << "\"closestKm\":" << iso.closestGeoKm;
        os << "}";
        if (i + 1 < b.isolated.size()) os << ",";
    }
    os << "],";

    os << "\"fit\":{";
    os << "\"fitted\":" << (b.fit.fitted ? "true" : "false") << ",";
    os << "\"training\":" << b.fit.trainingSize << ",";
    os << "\"neutral\":" << b.fit.neutralFallbacks << ",";
    os << "\"barriers\":" << b.fit.barriers << ",";
    os << "\"corridors\":" << b.fit.corridors << ",";
    os << "\"curve\":[";
    for (std::size_t k = 0; k < b.fit.curve.size(); ++k) {
        os << "[" << b.fit.curve[k].first << "," << b.fit.curve[k].second << "]";
        if (k + 1 < b.fit.curve.size()) os << ",";
    }
    os << "]}";
    os << "}";
}

}

std::string cellIdToString(CellId id) {
    std::ostringstream os;
    os << std::hex << std::setw(16) << std::setfill('0') << id;
    return os.str();
}

std::string resultToJson(const PipelineResult& result, bool includeBoundaries) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    HexGrid grid(result.config.hexResolution);

    os << "{";
    os << "\"request\":" << result.requestId << ",";
    os << "\"samples\":" << result.sampleCount << ",";
    writeConfig(os, result.config);
    os << ",\"bins\":[";
    for (std::size_t i = 0; i < result.bins.size(); ++i) {
        writeBin(os, result.bins[i], grid, includeBoundaries);
        if (i + 1 < result.bins.size()) os << ",";
    }
    os << "]";
    os << "}";

    return os.str();
}

std::string binToJson(const PipelineResult& result, std::uint32_t binIndex, bool includeBoundaries) {
    if (binIndex >= result.bins.size()) return "{}";
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);
    HexGrid grid(result.config.hexResolution);
    writeBin(os, result.bins[binIndex], grid, includeBoundaries);
    return os.str();
}

void logEdges(const PipelineResult& result, std::ostream& out, bool header) {
    if (header) {
        out << "bin,cell_a,cell_b,geo_km,genetic,scaled,class\n";
    }
    for (const auto& b : result.bins) {
        for (const auto& e : b.edges) {
            out << b.bin.index << ","
                << cellIdToString(e.cellA) << ","
                << cellIdToString(e.cellB) << ","
                << e.geoDistanceKm << ","
                << e.geneticDistance << ","
                << e.scaledDistance << ","
                << edgeClassName(e.classification) << "\n";
        }
    }
}

void printStatistics(const PipelineStatistics& stats, std::ostream& out) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "Samples:        " << stats.samples << "\n"
        << "Time bins:      " << stats.bins << " (" << stats.emptyBins << " empty, "
        << stats.fittedBins << " fitted)\n"
        << "Occupied cells: " << stats.cells << " (" << stats.unconnectedCells << " unconnected, "
        << stats.isolatedCells << " isolated)\n"
        << "Edges:          " << stats.edges << "\n"
        << "  barriers:     " << stats.barriers << "\n"
        << "  corridors:    " << stats.corridors << "\n"
        << "Mean genetic distance: " << stats.meanGeneticDistance << "\n"
        << "Mean edge length (km): " << stats.meanGeoDistanceKm << "\n";
    out << os.str();
}
