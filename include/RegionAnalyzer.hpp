#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace MothTrace {

// Integer pixel coordinate in (row, col) order.
struct PixelCoord {
    int row = 0;
    int col = 0;

    cv::Point toPoint() const { return cv::Point(col, row); }

    PixelCoord operator+(const PixelCoord& other) const {
        return PixelCoord{row + other.row, col + other.col};
    }
    bool operator==(const PixelCoord& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const PixelCoord& other) const { return !(*this == other); }
};

// A 4-connected component. Bounds are inclusive; coords are in row-major scan order.
struct Region {
    int label  = 0;
    int area   = 0;
    int minRow = 0;
    int minCol = 0;
    int maxRow = 0;
    int maxCol = 0;
    std::vector<PixelCoord> coords;

    cv::Rect bbox() const { return cv::Rect(minCol, minRow, maxCol - minCol + 1, maxRow - minRow + 1); }
};

class RegionAnalyzer {
public:
    // Labels the 4-connected foreground (non-zero) regions of a single-channel mask.
    // Regions are ordered by their first pixel in a row-major scan and labeled 1..N
    // in that order, whatever labeling algorithm OpenCV selects internally.
    static std::vector<Region> labelRegions(const cv::Mat& mask);

    // Same as labelRegions on the logical complement of the mask.
    static std::vector<Region> labelBackgroundRegions(const cv::Mat& mask);

    // First region of maximal area in scan order. Throws NoRegionsFound when empty.
    static const Region& largestRegion(const std::vector<Region>& regions);

    // Area descending; equal areas keep scan order (lower label first).
    static std::vector<Region> sortByAreaDescending(std::vector<Region> regions);

    // CV_8UC1 mask of the given size with the region's pixels set to 255.
    static cv::Mat regionMask(const Region& region, const cv::Size& size);

    // Normalizes any single-channel mask to CV_8UC1 with values 0 / 255.
    static cv::Mat toBinaryMask(const cv::Mat& mask);
};

} // namespace MothTrace
