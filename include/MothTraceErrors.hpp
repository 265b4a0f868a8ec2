#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace MothTrace {

// Base class of every domain error raised by the landmark pipeline.
// Invalid arguments are reported with std::invalid_argument instead.
class MothTraceError : public std::runtime_error {
public:
    explicit MothTraceError(const std::string& what) : std::runtime_error(what) {}
};

// An Otsu computation could not split the histogram (constant or degenerate input).
class ThresholdingFailed : public MothTraceError {
public:
    explicit ThresholdingFailed(const std::string& what) : MothTraceError(what) {}
};

// A detector that needs at least one region received none.
class NoRegionsFound : public MothTraceError {
public:
    explicit NoRegionsFound(const std::string& what) : MothTraceError(what) {}
};

// Advisory only: a fixed-count selection ("3 largest", "2 largest") found fewer
// regions than expected. Written as a [WARN] line, never thrown.
void warnAmbiguousRegionOrdering(const std::string& stage, size_t found, size_t expected);

} // namespace MothTrace
