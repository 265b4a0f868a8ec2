#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <utility>
#include <vector>

namespace MothTrace {

struct ProcessingParams {
    // Otsu histogram resolution
    int firstPassBins  = 60;            // Bins for the red-channel pass over the full image
    int secondPassBins = 256;           // Bins for the saturation pass over the specimen crop

    // Tag area separation
    double tagAreaFraction   = 0.5;     // Tag window starts at this fraction of the image width
    int maxTagRegions        = 3;       // Number of largest tag regions considered
    int tagErosionIterations = 1;       // Erosions applied before labeling tag regions

    // Landmark detection
    int antennaDilationIterations    = 35;   // Dilation iterations used to find antenna bridges
    double innerSearchHeightFraction = 0.75; // Inner pixel search window height (fraction of rows)

    // Debug visualization
    bool enableDebugOutput = false;
    bool verboseOutput     = false;      // Enable [INFO] console output
    std::string debugOutputPath = "./debug/";

    // Debug image stack (for automatic numbering). Stages append to it through
    // a const reference, so with enableDebugOutput set each concurrent
    // invocation needs its own ProcessingParams.
    mutable std::vector<std::pair<cv::Mat, std::string>> debugImageStack;
};

// Throws std::invalid_argument when a field is out of range.
void validateParams(const ProcessingParams& params);

} // namespace MothTrace
