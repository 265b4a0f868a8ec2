#pragma once

#include "ProcessingParams.hpp"
#include <opencv2/core.hpp>

namespace MothTrace {

class Binarizer {
public:
    // Otsu threshold over a single-channel image using nbins equal-width bins
    // spanning [min, max] of the data. Returns the center of the bin that
    // maximizes the between-class variance (first maximum on ties).
    // Throws ThresholdingFailed for constant or otherwise unsplittable input.
    static double otsuThreshold(const cv::Mat& channel, int nbins);

    // Fills background areas not reachable (4-connected) from the mask border.
    static cv::Mat fillHoles(const cv::Mat& mask);

    // Column separating the tag area (right) from the specimen (left). Looks at
    // rows [0, topRuler) and the right part of the frame only.
    static int findTagsEdge(const cv::Mat& binary, int topRuler, const ProcessingParams& params);

    // HSV saturation of a BGR image as CV_32F in [0, 1].
    static cv::Mat saturationChannel(const cv::Mat& bgrImg);

    // Refined specimen silhouette (CV_8UC1, 0 / 255) of size
    // topRuler x findTagsEdge(...). Accepts 8-bit or float BGR images.
    static cv::Mat binarize(const cv::Mat& bgrImg, int topRuler, const ProcessingParams& params);
    static cv::Mat binarize(const cv::Mat& bgrImg, int topRuler);
};

} // namespace MothTrace
