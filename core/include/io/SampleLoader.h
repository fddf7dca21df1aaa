#ifndef SAMPLE_LOADER_H
#define SAMPLE_LOADER_H

#include "kernel/SampleStore.h"
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

struct LoadReport {
    std::size_t rowsRead = 0;
    std::size_t rowsKept = 0;
    std::size_t skippedCoordinates = 0;   // "..", empty or non-numeric lat/lon
    std::size_t skippedAge = 0;           // missing or non-numeric age
};

// Tab-separated sample list with ID, Latitude, Longitude and Age columns.
// Rows that cannot be placed on the map are skipped and counted.
std::vector<Sample> readSamples(std::istream& in, LoadReport* report = nullptr);

// Tab-separated labelled matrix: header of sample ids, then one row per id.
// Rows and columns are reordered to `samples`; a sample missing from the
// matrix throws InputInconsistencyError.
DistanceMatrix readDistanceMatrix(std::istream& in, const std::vector<Sample>& samples);

// File front end for both readers; throws std::runtime_error when a file cannot be opened
std::shared_ptr<const SampleStore> loadSampleStore(const std::string& samplesPath,
                                                   const std::string& matrixPath,
                                                   LoadReport* report = nullptr);

#endif
