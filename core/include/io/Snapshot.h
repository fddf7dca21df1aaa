#ifndef RESULT_SNAPSHOT_H
#define RESULT_SNAPSHOT_H

#include "kernel/Pipeline.h"
#include <iosfwd>
#include <string>

// Hex text form of a cell id, e.g. "0831f8dfffffffff"
std::string cellIdToString(CellId id);

// JSON export of a pipeline result (cells, edges, fit per bin)
std::string resultToJson(const PipelineResult& result, bool includeBoundaries = false);

// One bin only; empty object when the index is out of range
std::string binToJson(const PipelineResult& result, std::uint32_t binIndex, bool includeBoundaries = false);

// CSV edge log: bin,cell_a,cell_b,geo_km,genetic,scaled,class
void logEdges(const PipelineResult& result, std::ostream& out, bool header = true);

// Human-readable totals
void printStatistics(const PipelineStatistics& stats, std::ostream& out);

#endif
