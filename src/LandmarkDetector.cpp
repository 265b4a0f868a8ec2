#include "LandmarkDetector.hpp"
#include "ImageUtils.hpp"
#include "MothTraceErrors.hpp"
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace MothTrace {

int LandmarkDetector::splitPicture(const Mat& binary) {
    Mat ones = RegionAnalyzer::toBinaryMask(binary) / 255;

    Mat columnWeights;
    reduce(ones, columnWeights, 0, REDUCE_SUM, CV_64F);
    double total = sum(columnWeights)[0];
    if (total <= 0.0) {
        throw NoRegionsFound("Cannot split an empty silhouette");
    }

    double columnCentroid = 0.0;
    const double* weights = columnWeights.ptr<double>(0);
    for (int c = 0; c < columnWeights.cols; c++) {
        columnCentroid += c * (weights[c] / total);
    }
    return cvRound(columnCentroid);
}

PixelCoord LandmarkDetector::bodyCenter(const Mat& binary, int middle) {
    if (middle < 0 || middle >= binary.cols) {
        throw invalid_argument("Midline column " + to_string(middle) + " outside the mask");
    }

    Mat middleArr = RegionAnalyzer::toBinaryMask(binary.col(middle));
    long long rowSum = 0;
    long long count = 0;
    for (int r = 0; r < middleArr.rows; r++) {
        if (middleArr.at<uchar>(r, 0)) {
            rowSum += r;
            count++;
        }
    }
    if (count == 0) {
        throw NoRegionsFound("No body pixels in midline column " + to_string(middle));
    }
    return PixelCoord{static_cast<int>(rowSum / count), middle};
}

Mat LandmarkDetector::removeAntenna(const Mat& halfBinary, const ProcessingParams& params) {
    Mat withoutAntenna = RegionAnalyzer::toBinaryMask(halfBinary).clone();

    vector<Region> regions = RegionAnalyzer::sortByAreaDescending(
        RegionAnalyzer::labelBackgroundRegions(withoutAntenna));
    if (regions.size() < 2) {
        // No enclosed background, so no antenna touches the wing
        if (params.verboseOutput) cout << "[INFO] No antenna bridge found" << endl;
        return withoutAntenna;
    }

    Mat kernel = getStructuringElement(MORPH_CROSS, Size(3, 3));
    Mat dilatedBg, dilatedHole;
    dilate(RegionAnalyzer::regionMask(regions[0], withoutAntenna.size()), dilatedBg, kernel,
           Point(-1, -1), params.antennaDilationIterations, BORDER_CONSTANT, Scalar(0));
    dilate(RegionAnalyzer::regionMask(regions[1], withoutAntenna.size()), dilatedHole, kernel,
           Point(-1, -1), params.antennaDilationIterations, BORDER_CONSTANT, Scalar(0));

    Mat intersection;
    bitwise_and(dilatedBg, dilatedHole, intersection);
    withoutAntenna.setTo(0, intersection);

    if (params.verboseOutput) {
        cout << "[INFO] Antenna removal cleared " << countNonZero(intersection & RegionAnalyzer::toBinaryMask(halfBinary))
             << " pixels between background regions of " << regions[0].area << " and "
             << regions[1].area << " pixels" << endl;
    }
    return withoutAntenna;
}

PixelCoord LandmarkDetector::detectOuterPix(const Mat& halfBinary, const PixelCoord& center) {
    vector<Region> regions = RegionAnalyzer::labelRegions(halfBinary);
    if (regions.empty()) {
        throw NoRegionsFound("No wing region found for outer pixel detection");
    }
    const Region& wing = RegionAnalyzer::largestRegion(regions);

    // Squared distances keep the comparison exact; first pixel wins ties
    PixelCoord outerPix = wing.coords.front();
    long long maxDist = -1;
    for (const auto& p : wing.coords) {
        long long dr = p.row - center.row;
        long long dc = p.col - center.col;
        long long dist = dr * dr + dc * dc;
        if (dist > maxDist) {
            maxDist = dist;
            outerPix = p;
        }
    }
    return outerPix;
}

PixelCoord LandmarkDetector::detectInnerPix(const Mat& halfBinary, const PixelCoord& outerPix,
                                            WingSide side, const ProcessingParams& params) {
    if (outerPix.col < 0 || outerPix.col > halfBinary.cols) {
        throw invalid_argument("Outer pixel column " + to_string(outerPix.col) + " outside the half mask");
    }

    int lowerBound = static_cast<int>(halfBinary.rows * params.innerSearchHeightFraction);
    Range colRange = (side == WingSide::Left) ? Range(outerPix.col, halfBinary.cols)
                                              : Range(0, outerPix.col);
    if (lowerBound <= 0 || colRange.size() <= 0) {
        throw NoRegionsFound("Inner pixel search window is empty");
    }

    Mat focus = halfBinary(Range(0, lowerBound), colRange);

    // The first background region in scan order is taken as the pocket above
    // the wing. A different label order would select another pocket.
    vector<Region> regions = RegionAnalyzer::labelBackgroundRegions(focus);
    if (regions.empty()) {
        throw NoRegionsFound("No background region found above the wing");
    }
    const Region& pocket = regions.front();

    // Lowest row of the pocket, then the column closest to the body
    int yMax = pocket.maxRow;
    bool found = false;
    PixelCoord innerPix;
    for (const auto& p : pocket.coords) {
        if (p.row != yMax) continue;
        if (!found
            || (side == WingSide::Left && p.col > innerPix.col)
            || (side == WingSide::Right && p.col < innerPix.col)) {
            innerPix = p;
            found = true;
        }
    }
    return innerPix;
}

LandmarksResult LandmarkDetector::detectLandmarks(const Mat& binary, const ProcessingParams& params,
                                                  const vector<RenderSurface*>& surfaces) {
    if (binary.empty()) {
        throw invalid_argument("Silhouette mask cannot be empty");
    }
    validateParams(params);
    Mat mask = RegionAnalyzer::toBinaryMask(binary);

    // Split the butterfly
    int middle = splitPicture(mask);
    if (middle <= 0 || middle >= mask.cols) {
        throw NoRegionsFound("Midline at column " + to_string(middle) + " leaves an empty wing half");
    }
    if (params.verboseOutput) cout << "[INFO] Midline at column " << middle << endl;

    Mat binaryLeft = mask.colRange(0, middle);
    Mat binaryRight = mask.colRange(middle, mask.cols);

    PixelCoord center = bodyCenter(mask, middle);

    // Left wing
    Mat withoutAntennaL = removeAntenna(binaryLeft, params);
    PixelCoord outerPixL = detectOuterPix(withoutAntennaL, center);
    PixelCoord innerPixL = detectInnerPix(withoutAntennaL, outerPixL, WingSide::Left, params)
                           + PixelCoord{0, outerPixL.col};

    // Right wing, measured from the body center in the right half frame
    PixelCoord centerR{center.row, 0};
    Mat withoutAntennaR = removeAntenna(binaryRight, params);
    PixelCoord outerPixR = detectOuterPix(withoutAntennaR, centerR);
    PixelCoord innerPixR = detectInnerPix(withoutAntennaR, outerPixR, WingSide::Right, params);
    innerPixR = innerPixR + PixelCoord{0, middle};
    outerPixR = outerPixR + PixelCoord{0, middle};

    LandmarksResult result(outerPixL, innerPixL, outerPixR, innerPixR, center);
    if (params.verboseOutput) cout << "[INFO] Landmarks:\n" << result.toString() << endl;

    ImageUtils::pushDebugImage(withoutAntennaL, "without_antenna_left", params);
    ImageUtils::pushDebugImage(withoutAntennaR, "without_antenna_right", params);

    // Reconstruct binary image without antennae
    Mat withoutAntennae;
    hconcat(withoutAntennaL, withoutAntennaR, withoutAntennae);

    drawPointsOfInterest(surfaces, withoutAntennae, middle, result);
    if (params.enableDebugOutput) {
        MatRenderSurface debugOverlay;
        drawPointsOfInterest({nullptr, nullptr, &debugOverlay}, withoutAntennae, middle, result);
        ImageUtils::pushDebugImage(debugOverlay.canvas(), "landmarks", params);
    }
    return result;
}

LandmarksResult LandmarkDetector::detectLandmarks(const Mat& binary) {
    ProcessingParams params;
    return detectLandmarks(binary, params);
}

void LandmarkDetector::drawPointsOfInterest(const vector<RenderSurface*>& surfaces,
                                            const Mat& withoutAntennae, int middle,
                                            const LandmarksResult& result) {
    if (surfaces.size() < 3 || surfaces[2] == nullptr) return;

    RenderSurface* ax = surfaces[2];
    ax->setTitle("Points of interest");
    ax->showImage(withoutAntennae);
    ax->drawDashedVerticalLine(middle, Scalar(255, 0, 255));

    // Smaller markers when a fourth surface shares the figure
    int markerSize = 10;
    if (surfaces.size() > 3 && surfaces[3] != nullptr) {
        markerSize = 2;
    }

    vector<PixelCoord> points;
    for (const auto& entry : result.entries()) {
        points.push_back(entry.second);
    }
    ax->scatter(points, Scalar(0, 0, 255), markerSize);
}

} // namespace MothTrace
