#pragma once

#include "Landmarks.hpp"
#include "ProcessingParams.hpp"
#include "RegionAnalyzer.hpp"
#include "RenderSurface.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace MothTrace {

class LandmarkDetector {
public:
    // Column of the foreground center of gravity, rounded to the nearest integer.
    static int splitPicture(const cv::Mat& binary);

    // (integer mean row of the foreground in column `middle`, middle).
    static PixelCoord bodyCenter(const cv::Mat& binary, int middle);

    // Clears the thin bridge between the two largest background regions of a
    // wing half. Works on a copy; returns an unmodified copy when the half has
    // fewer than two background regions.
    static cv::Mat removeAntenna(const cv::Mat& halfBinary, const ProcessingParams& params);

    // Wingtip: pixel of the largest region farthest from `center`, in the
    // half-mask frame.
    static PixelCoord detectOuterPix(const cv::Mat& halfBinary, const PixelCoord& center);

    // Shoulder between wing and body. The result is relative to the search
    // window: add (0, outerPix.col) for the left side to get half-mask
    // coordinates. The right-side window starts at column 0.
    static PixelCoord detectInnerPix(const cv::Mat& halfBinary, const PixelCoord& outerPix,
                                     WingSide side, const ProcessingParams& params);

    // Full landmark extraction on a silhouette mask. When surfaces has a third
    // entry, the antenna-free mask, midline and landmarks are drawn on it.
    static LandmarksResult detectLandmarks(const cv::Mat& binary, const ProcessingParams& params,
                                           const std::vector<RenderSurface*>& surfaces = {});
    static LandmarksResult detectLandmarks(const cv::Mat& binary);

private:
    static void drawPointsOfInterest(const std::vector<RenderSurface*>& surfaces,
                                     const cv::Mat& withoutAntennae, int middle,
                                     const LandmarksResult& result);
};

} // namespace MothTrace
