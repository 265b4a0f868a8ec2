#include "RegionAnalyzer.hpp"
#include "MothTraceErrors.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace MothTrace {

Mat RegionAnalyzer::toBinaryMask(const Mat& mask) {
    if (mask.channels() != 1) {
        throw invalid_argument("Binary masks must have a single channel");
    }
    if (mask.empty()) {
        return Mat::zeros(mask.size(), CV_8UC1);
    }
    return mask != 0;
}

vector<Region> RegionAnalyzer::labelRegions(const Mat& mask) {
    Mat binary = toBinaryMask(mask);
    if (binary.empty()) {
        return {};
    }

    Mat labels, stats, centroids;
    int numComponents = connectedComponentsWithStats(binary, labels, stats, centroids, 4, CV_32S);

    // OpenCV labels are mapped to scan order: the first component met in a
    // row-major scan becomes region 1.
    vector<int> order(numComponents, -1);
    vector<Region> regions;
    regions.reserve(numComponents > 0 ? numComponents - 1 : 0);

    for (int r = 0; r < labels.rows; ++r) {
        const int* row = labels.ptr<int>(r);
        for (int c = 0; c < labels.cols; ++c) {
            int l = row[c];
            if (l == 0) continue;

            if (order[l] < 0) {
                order[l] = static_cast<int>(regions.size());

                Region region;
                region.label  = static_cast<int>(regions.size()) + 1;
                region.area   = stats.at<int>(l, CC_STAT_AREA);
                region.minCol = stats.at<int>(l, CC_STAT_LEFT);
                region.minRow = stats.at<int>(l, CC_STAT_TOP);
                region.maxCol = region.minCol + stats.at<int>(l, CC_STAT_WIDTH) - 1;
                region.maxRow = region.minRow + stats.at<int>(l, CC_STAT_HEIGHT) - 1;
                region.coords.reserve(region.area);
                regions.push_back(std::move(region));
            }
            regions[order[l]].coords.push_back(PixelCoord{r, c});
        }
    }

    return regions;
}

vector<Region> RegionAnalyzer::labelBackgroundRegions(const Mat& mask) {
    Mat binary = toBinaryMask(mask);
    Mat inverted;
    bitwise_not(binary, inverted);
    return labelRegions(inverted);
}

const Region& RegionAnalyzer::largestRegion(const vector<Region>& regions) {
    if (regions.empty()) {
        throw NoRegionsFound("No regions found in mask");
    }

    size_t bestIdx = 0;
    for (size_t i = 1; i < regions.size(); i++) {
        if (regions[i].area > regions[bestIdx].area) {
            bestIdx = i;
        }
    }
    return regions[bestIdx];
}

vector<Region> RegionAnalyzer::sortByAreaDescending(vector<Region> regions) {
    sort(regions.begin(), regions.end(), [](const Region& a, const Region& b) {
        if (a.area != b.area) return a.area > b.area;
        return a.label < b.label;
    });
    return regions;
}

Mat RegionAnalyzer::regionMask(const Region& region, const Size& size) {
    Mat mask = Mat::zeros(size, CV_8UC1);
    for (const auto& p : region.coords) {
        mask.at<uchar>(p.row, p.col) = 255;
    }
    return mask;
}

} // namespace MothTrace
