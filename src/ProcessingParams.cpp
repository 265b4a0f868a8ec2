#include "ProcessingParams.hpp"
#include <stdexcept>

using namespace std;

namespace MothTrace {

void validateParams(const ProcessingParams& params) {
    if (params.firstPassBins < 2 || params.firstPassBins > 65536) {
        throw invalid_argument("firstPassBins must be in [2, 65536]");
    }
    if (params.secondPassBins < 2 || params.secondPassBins > 65536) {
        throw invalid_argument("secondPassBins must be in [2, 65536]");
    }
    if (params.tagAreaFraction < 0.0 || params.tagAreaFraction >= 1.0) {
        throw invalid_argument("tagAreaFraction must be in [0, 1)");
    }
    if (params.maxTagRegions < 1) {
        throw invalid_argument("maxTagRegions must be at least 1");
    }
    if (params.tagErosionIterations < 0 || params.tagErosionIterations > 100) {
        throw invalid_argument("tagErosionIterations must be in [0, 100]");
    }
    if (params.antennaDilationIterations < 1 || params.antennaDilationIterations > 1000) {
        throw invalid_argument("antennaDilationIterations must be in [1, 1000]");
    }
    if (params.innerSearchHeightFraction <= 0.0 || params.innerSearchHeightFraction > 1.0) {
        throw invalid_argument("innerSearchHeightFraction must be in (0, 1]");
    }
}

} // namespace MothTrace
