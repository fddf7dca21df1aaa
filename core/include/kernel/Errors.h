#ifndef KERNEL_ERRORS_H
#define KERNEL_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Input data does not agree with itself (matrix shape vs sample count,
// a cell member that names no sample, an empty cell at aggregation time).
// Aborts the whole recomputation.
class InputInconsistencyError : public std::runtime_error {
public:
    InputInconsistencyError(const std::string& what, std::vector<std::size_t> indices = {})
        : std::runtime_error(what), indices_(std::move(indices)) {}

    const std::vector<std::size_t>& indices() const { return indices_; }

private:
    std::vector<std::size_t> indices_;
};

// A configuration value outside its documented domain. Raised before any work starts.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

#endif
