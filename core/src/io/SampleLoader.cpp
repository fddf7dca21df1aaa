#include "io/SampleLoader.h"
#include "kernel/Errors.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace {

std::vector<std::string> splitTabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(line);
    while (std::getline(iss, field, '\t')) {
        if (!field.empty() && field.back() == '\r') field.pop_back();
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == '\t') fields.emplace_back();
    return fields;
}

bool parseDouble(const std::string& text, double& value) {
    if (text.empty() || text == "..") return false;
    try {
        std::size_t used = 0;
        value = std::stod(text, &used);
        return used == text.size() && std::isfinite(value);
    } catch (const std::exception&) {
        return false;
    }
}

int findColumn(const std::vector<std::string>& header, const std::string& name) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

}

std::vector<Sample> readSamples(std::istream& in, LoadReport* report) {
    LoadReport local;
    LoadReport& r = report ? *report : local;

    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("sample list is empty");
    }
    const auto header = splitTabs(line);
    const int col_id = findColumn(header, "ID");
    const int col_lat = findColumn(header, "Latitude");
    const int col_lon = findColumn(header, "Longitude");
    const int col_age = findColumn(header, "Age");
    if (col_id < 0 || col_lat < 0 || col_lon < 0 || col_age < 0) {
        throw std::runtime_error("sample list header must name ID, Latitude, Longitude and Age");
    }
    const std::size_t needed = static_cast<std::size_t>(
        std::max(std::max(col_id, col_lat), std::max(col_lon, col_age))) + 1;

    std::vector<Sample> samples;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        ++r.rowsRead;
        const auto fields = splitTabs(line);
        if (fields.size() < needed) {
            ++r.skippedCoordinates;
            continue;
        }

        Sample s;
        s.id = fields[col_id];
        if (!parseDouble(fields[col_lat], s.lat) || !parseDouble(fields[col_lon], s.lon) ||
            s.lat < -90.0 || s.lat > 90.0 || s.lon < -180.0 || s.lon > 180.0) {
            ++r.skippedCoordinates;
            continue;
        }
        double age = 0.0;
        if (!parseDouble(fields[col_age], age) || age < 0.0) {
            ++r.skippedAge;
            continue;
        }
        s.age = static_cast<std::int64_t>(std::llround(age));
        samples.push_back(std::move(s));
        ++r.rowsKept;
    }
    return samples;
}

DistanceMatrix readDistanceMatrix(std::istream& in, const std::vector<Sample>& samples) {
    std::string line;
    if (!std::getline(in, line)) {
        throw InputInconsistencyError("distance matrix is empty");
    }
    auto header = splitTabs(line);
    // The corner cell above the row labels may be empty or absent
    if (!header.empty() && header.front().empty()) header.erase(header.begin());

    std::unordered_map<std::string, std::size_t> column_of;
    for (std::size_t c = 0; c < header.size(); ++c) column_of[header[c]] = c;

    std::unordered_map<std::string, std::size_t> wanted;
    for (std::size_t i = 0; i < samples.size(); ++i) wanted[samples[i].id] = i;

    std::vector<std::size_t> column_index(samples.size());
    std::vector<std::size_t> missing;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        auto it = column_of.find(samples[i].id);
        if (it == column_of.end()) {
            missing.push_back(i);
        } else {
            column_index[i] = it->second;
        }
    }
    if (!missing.empty()) {
        throw InputInconsistencyError(std::to_string(missing.size()) +
                                      " sample(s) have no column in the distance matrix, first '" +
                                      samples[missing.front()].id + "'", missing);
    }

    std::vector<std::vector<double>> rows(samples.size());
    std::vector<bool> seen(samples.size(), false);
    std::size_t row_number = 0;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        ++row_number;
        const auto fields = splitTabs(line);
        if (fields.empty()) continue;
        auto it = wanted.find(fields.front());
        if (it == wanted.end()) continue;   // filtered sample

        const std::size_t target = it->second;
        if (fields.size() != header.size() + 1) {
            throw InputInconsistencyError("distance matrix row " + std::to_string(row_number) + " ('" +
                                          fields.front() + "') has " + std::to_string(fields.size() - 1) +
                                          " values, expected " + std::to_string(header.size()),
                                          {target});
        }
        rows[target].resize(samples.size());
        for (std::size_t j = 0; j < samples.size(); ++j) {
            double v = 0.0;
            if (!parseDouble(fields[column_index[j] + 1], v)) {
                throw InputInconsistencyError("distance matrix value for ('" + samples[target].id + "','" +
                                              samples[j].id + "') is not a number", {target, j});
            }
            rows[target][j] = v;
        }
        seen[target] = true;
    }

    for (std::size_t i = 0; i < samples.size(); ++i) {
        if (!seen[i]) missing.push_back(i);
    }
    if (!missing.empty()) {
        throw InputInconsistencyError(std::to_string(missing.size()) +
                                      " sample(s) have no row in the distance matrix, first '" +
                                      samples[missing.front()].id + "'", missing);
    }
    return DistanceMatrix::fromRows(rows);
}

std::shared_ptr<const SampleStore> loadSampleStore(const std::string& samplesPath,
                                                   const std::string& matrixPath,
                                                   LoadReport* report) {
    std::ifstream samples_file(samplesPath);
    if (!samples_file.is_open()) {
        throw std::runtime_error("could not open sample list '" + samplesPath + "'");
    }
    std::vector<Sample> samples = readSamples(samples_file, report);

    std::ifstream matrix_file(matrixPath);
    if (!matrix_file.is_open()) {
        throw std::runtime_error("could not open distance matrix '" + matrixPath + "'");
    }
    DistanceMatrix distances = readDistanceMatrix(matrix_file, samples);

    return std::make_shared<const SampleStore>(std::move(samples), std::move(distances));
}
