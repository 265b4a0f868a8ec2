#pragma once

#include "ProcessingParams.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace MothTrace {

class ImageUtils {
public:
    static cv::Mat loadImage(const std::string& path);

    // Converts 8-bit, 16-bit or float images to CV_32F, scaling integer data to [0, 1].
    static cv::Mat toUnitFloat(const cv::Mat& img);

    static void pushDebugImage(const cv::Mat& image, const std::string& name, const ProcessingParams& params);
    static void flushDebugStack(const ProcessingParams& params);
};

} // namespace MothTrace
