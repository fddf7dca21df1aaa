#include "kernel/Errors.h"
#include "kernel/Pipeline.h"
#include "io/SampleLoader.h"
#include "io/Snapshot.h"
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

static void printHelp() {
    std::cerr << "STARGEN Commands:\n"
              << "  load S M           # load sample list S and distance matrix M (tab-separated)\n"
              << "  bins K             # number of time bins\n"
              << "  binning width|count # equal age span or equal sample count per bin\n"
              << "  resolution R       # hex grid level (0-15, 3 = ~69 km edges)\n"
              << "  bandwidth f        # LOWESS fraction in (0, 1]\n"
              << "  iterations N       # LOWESS robustness passes\n"
              << "  monotone on|off    # force a non-decreasing distance curve\n"
              << "  thresholds Tb Tc   # barrier (> 1) and corridor (0..1) ratios\n"
              << "  isolation T        # ratio every link of an isolated population reaches\n"
              << "  maxedge KM         # drop neighbor edges longer than KM (0 = keep all)\n"
              << "  threads N          # worker threads across bins (0 = default)\n"
              << "  config             # print current configuration\n"
              << "  run                # recompute every bin\n"
              << "  stats              # totals for the last run\n"
              << "  state [boundaries] # print JSON of the last run\n"
              << "  bin B [boundaries] # print JSON of one time bin\n"
              << "  edges              # print CSV of every classified edge\n"
              << "  barriers [B]       # list barrier and corridor edges\n"
              << "  isolated [B]       # list isolated populations and their closest relatives\n"
              << "  quit               # exit\n"
              << "\nOptions: --samples=<file> --matrix=<file> --bins=K --resolution=R --bandwidth=f\n"
              << "         --barrier=Tb --corridor=Tc --isolated=T --binning=width|count\n"
              << "         --maxedge=KM --threads=N\n"
              << "         or STARGEN_BINNING env var to choose the binning mode\n";
}

static BinningMode parseBinning(const std::string& value) {
    if (value == "width") return BinningMode::EqualWidth;
    if (value == "count") return BinningMode::EqualCount;
    throw ConfigurationError("binning must be 'width' or 'count' (got '" + value + "')");
}

static void printConfig(const PipelineConfig& cfg) {
    std::cout << "bins=" << cfg.binCount
              << " binning=" << binningModeName(cfg.binning)
              << " resolution=" << cfg.hexResolution
              << " (edge ~" << std::fixed << std::setprecision(1) << HexGrid::edgeLengthKm(cfg.hexResolution) << " km)"
              << std::setprecision(3)
              << " bandwidth=" << cfg.lowessBandwidth
              << " iterations=" << cfg.lowessIterations
              << " monotone=" << (cfg.monotoneFit ? "on" : "off")
              << " barrier=" << cfg.barrierThreshold
              << " corridor=" << cfg.corridorThreshold
              << " isolated=" << cfg.isolatedThreshold
              << " maxedge=" << cfg.maxEdgeKm
              << " threads=" << cfg.threads << "\n";
}

static void printAnomalies(const BinResult& b) {
    std::cout << "Bin " << b.bin.index << " [" << formatAgeLabel(b.bin.ageMin, b.bin.ageMax) << "]: "
              << b.fit.barriers << " barrier(s), " << b.fit.corridors << " corridor(s)"
              << (b.fit.fitted ? "" : " (no fit)") << "\n";
    for (const auto& e : b.edges) {
        if (e.classification != EdgeClass::Barrier && e.classification != EdgeClass::Corridor) continue;
        std::cout << "  " << std::setw(8) << edgeClassName(e.classification) << " "
                  << cellIdToString(e.cellA) << " - " << cellIdToString(e.cellB)
                  << std::fixed << std::setprecision(3)
                  << "  geo=" << e.geoDistanceKm << "km"
                  << " genetic=" << e.geneticDistance
                  << " scaled=" << e.scaledDistance << "\n";
    }
}

static void printIsolated(const BinResult& b) {
    std::cout << "Bin " << b.bin.index << " [" << formatAgeLabel(b.bin.ageMin, b.bin.ageMax) << "]: "
              << b.isolated.size() << " isolated population(s)" << (b.fit.fitted ? "" : " (no fit)") << "\n";
    for (const auto& iso : b.isolated) {
        const HexCell& cell = b.cells[iso.cell];
        std::cout << "  " << cellIdToString(cell.id)
                  << std::fixed << std::setprecision(3)
                  << "  samples=" << cell.members.size()
                  << " links=" << iso.edges
                  << " min_scaled=" << iso.minScaledDistance
                  << " internal=" << iso.internalDistance;
        if (iso.closestCell >= 0) {
            std::cout << "  closest=" << cellIdToString(b.cells[iso.closestCell].id)
                      << " genetic=" << iso.closestDistance
                      << " geo=" << iso.closestGeoKm << "km";
        }
        std::cout << "\n";
    }
}

static std::unique_ptr<Pipeline> g_pipeline;

static void loadStore(const std::string& samplesPath, const std::string& matrixPath) {
    LoadReport report;
    auto store = loadSampleStore(samplesPath, matrixPath, &report);
    std::cerr << "Loaded " << report.rowsKept << "/" << report.rowsRead << " samples ("
              << report.skippedCoordinates << " without coordinates, "
              << report.skippedAge << " without age)\n";
    g_pipeline = std::make_unique<Pipeline>(std::move(store));
}

int main(int argc, char** argv) {
    PipelineConfig cfg;
    std::string samplesPath;
    std::string matrixPath;

    try {
        if (const char* envBinning = std::getenv("STARGEN_BINNING")) {
            cfg.binning = parseBinning(envBinning);
        }

        const char* scriptArg = nullptr;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto valueOf = [&arg]() { return arg.substr(arg.find('=') + 1); };
            if (arg.rfind("--samples=", 0) == 0) {
                samplesPath = valueOf();
            } else if (arg.rfind("--matrix=", 0) == 0) {
                matrixPath = valueOf();
            } else if (arg.rfind("--bins=", 0) == 0) {
                cfg.binCount = static_cast<std::uint32_t>(std::stoul(valueOf()));
            } else if (arg.rfind("--resolution=", 0) == 0) {
                cfg.hexResolution = std::stoi(valueOf());
            } else if (arg.rfind("--bandwidth=", 0) == 0) {
                cfg.lowessBandwidth = std::stod(valueOf());
            } else if (arg.rfind("--barrier=", 0) == 0) {
                cfg.barrierThreshold = std::stod(valueOf());
            } else if (arg.rfind("--corridor=", 0) == 0) {
                cfg.corridorThreshold = std::stod(valueOf());
            } else if (arg.rfind("--isolated=", 0) == 0) {
                cfg.isolatedThreshold = std::stod(valueOf());
            } else if (arg.rfind("--binning=", 0) == 0) {
                cfg.binning = parseBinning(valueOf());
            } else if (arg.rfind("--maxedge=", 0) == 0) {
                cfg.maxEdgeKm = std::stod(valueOf());
            } else if (arg.rfind("--threads=", 0) == 0) {
                cfg.threads = std::stoi(valueOf());
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        }

        validateConfig(cfg);
        if (!samplesPath.empty() || !matrixPath.empty()) {
            if (samplesPath.empty() || matrixPath.empty()) {
                std::cerr << "Error: --samples and --matrix must be given together\n";
                return 1;
            }
            loadStore(samplesPath, matrixPath);
        }

        std::istream* input = &std::cin;
        std::ifstream scriptFile;
        if (scriptArg) {
            scriptFile.open(scriptArg);
            if (!scriptFile.is_open()) {
                std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
                return 1;
            }
            input = &scriptFile;
            std::cerr << "Running commands from script file: " << scriptArg << "\n";
        } else {
            std::ios::sync_with_stdio(false);
            std::cin.tie(nullptr);
            printHelp();
        }

        std::string line;
        while (std::getline(*input, line)) {
            std::istringstream iss(line);
            std::string cmd;
            if (!(iss >> cmd) || cmd[0] == '#') continue;

            try {
                if (cmd == "quit" || cmd == "exit") {
                    break;
                } else if (cmd == "help") {
                    printHelp();
                } else if (cmd == "load") {
                    std::string s, m;
                    if (!(iss >> s >> m)) {
                        std::cerr << "Usage: load SAMPLES MATRIX\n";
                        continue;
                    }
                    loadStore(s, m);
                } else if (cmd == "bins") {
                    PipelineConfig next = cfg;
                    long k = 0;
                    if (!(iss >> k) || k < 1) throw ConfigurationError("Usage: bins K (K >= 1)");
                    next.binCount = static_cast<std::uint32_t>(k);
                    validateConfig(next);
                    cfg = next;
                } else if (cmd == "binning") {
                    std::string mode;
                    iss >> mode;
                    cfg.binning = parseBinning(mode);
                } else if (cmd == "resolution") {
                    PipelineConfig next = cfg;
                    if (!(iss >> next.hexResolution)) throw ConfigurationError("Usage: resolution R");
                    validateConfig(next);
                    cfg = next;
                } else if (cmd == "bandwidth") {
                    PipelineConfig next = cfg;
                    if (!(iss >> next.lowessBandwidth)) throw ConfigurationError("Usage: bandwidth f");
                    validateConfig(next);
                    cfg = next;
                } else if (cmd == "iterations") {
                    PipelineConfig next = cfg;
                    if (!(iss >> next.lowessIterations)) throw ConfigurationError("Usage: iterations N");
                    validateConfig(next);
                    cfg = next;
                } else if (cmd == "monotone") {
                    std::string flag;
                    iss >> flag;
                    if (flag != "on" && flag != "off") throw ConfigurationError("Usage: monotone on|off");
                    cfg.monotoneFit = (flag == "on");
                } else if (cmd == "thresholds") {
                    PipelineConfig next = cfg;
                    if (!(iss >> next.barrierThreshold >> next.corridorThreshold)) {
                        throw ConfigurationError("Usage: thresholds Tb Tc");
                    }
                    validateConfig(next);
                    cfg = next;
                } else if (cmd == "isolation") {
                    PipelineConfig next = cfg;
                    if (!(iss >> next.isolatedThreshold)) throw ConfigurationError("Usage: isolation T");
                    validateConfig(next);
                    cfg = next;
                } else if (cmd == "maxedge") {
                    PipelineConfig next = cfg;
                    if (!(iss >> next.maxEdgeKm)) throw ConfigurationError("Usage: maxedge KM");
                    validateConfig(next);
                    cfg = next;
                } else if (cmd == "threads") {
                    PipelineConfig next = cfg;
                    if (!(iss >> next.threads)) throw ConfigurationError("Usage: threads N");
                    validateConfig(next);
                    cfg = next;
                } else if (cmd == "config") {
                    printConfig(cfg);
                } else if (cmd == "run") {
                    if (!g_pipeline) {
                        std::cerr << "No data loaded. Use 'load SAMPLES MATRIX' first.\n";
                        continue;
                    }
                    std::cerr << "Recomputing " << cfg.binCount << " bins at resolution "
                              << cfg.hexResolution << "...\n";
                    auto result = g_pipeline->submit(cfg);
                    if (!result) {
                        std::cerr << "Run superseded by a newer request\n";
                        continue;
                    }
                    auto stats = computeStatistics(*result);
                    std::cerr << "Done in " << std::fixed << std::setprecision(1) << result->elapsedMs
                              << " ms: " << stats.cells << " cells, " << stats.edges << " edges, "
                              << stats.barriers << " barriers, " << stats.corridors << " corridors\n";
                } else if (cmd == "stats" || cmd == "state" || cmd == "bin" || cmd == "edges" ||
                           cmd == "barriers" || cmd == "isolated") {
                    auto result = g_pipeline ? g_pipeline->current() : nullptr;
                    if (!result) {
                        std::cerr << "No results yet. Run 'run' first.\n";
                        continue;
                    }
                    if (cmd == "stats") {
                        printStatistics(computeStatistics(*result), std::cout);
                    } else if (cmd == "state") {
                        std::string opt;
                        iss >> opt;
                        std::cout << resultToJson(*result, opt == "boundaries") << "\n";
                    } else if (cmd == "bin") {
                        long b = -1;
                        std::string opt;
                        iss >> b >> opt;
                        if (b < 0 || static_cast<std::size_t>(b) >= result->bins.size()) {
                            std::cerr << "Usage: bin B (0.." << result->bins.size() - 1 << ")\n";
                            continue;
                        }
                        std::cout << binToJson(*result, static_cast<std::uint32_t>(b), opt == "boundaries") << "\n";
                    } else if (cmd == "edges") {
                        logEdges(*result, std::cout);
                    } else {
                        auto report = (cmd == "isolated") ? printIsolated : printAnomalies;
                        long b = -1;
                        if (iss >> b) {
                            if (b < 0 || static_cast<std::size_t>(b) >= result->bins.size()) {
                                std::cerr << "Time bin " << b << " not found.\n";
                                continue;
                            }
                            report(result->bins[b]);
                        } else {
                            for (const auto& bin : result->bins) report(bin);
                        }
                    }
                } else {
                    std::cerr << "Unknown command: " << cmd << "\n";
                }
                std::cout.flush();
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
