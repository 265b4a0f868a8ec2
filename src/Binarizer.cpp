#include "Binarizer.hpp"
#include "ImageUtils.hpp"
#include "MothTraceErrors.hpp"
#include "RegionAnalyzer.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace MothTrace {

double Binarizer::otsuThreshold(const Mat& channel, int nbins) {
    if (channel.empty() || channel.channels() != 1) {
        throw invalid_argument("Otsu thresholding needs a non-empty single-channel image");
    }
    if (nbins < 2) {
        throw invalid_argument("Otsu thresholding needs at least 2 bins");
    }

    Mat data;
    channel.convertTo(data, CV_32F);

    double minVal = 0.0, maxVal = 0.0;
    minMaxLoc(data, &minVal, &maxVal);
    if (!(maxVal > minVal)) {
        throw ThresholdingFailed("Otsu threshold undefined: constant intensity (" + to_string(minVal) + ")");
    }

    // calcHist excludes the upper range bound, so nudge it to keep max in the last bin
    float lower = static_cast<float>(minVal);
    float upper = nextafter(static_cast<float>(maxVal), numeric_limits<float>::infinity());
    float range[] = {lower, upper};
    const float* ranges[] = {range};
    int channels[] = {0};
    Mat hist;
    calcHist(&data, 1, channels, Mat(), hist, 1, &nbins, ranges, true, false);

    double binWidth = (maxVal - minVal) / nbins;
    vector<double> centers(nbins), counts(nbins);
    for (int i = 0; i < nbins; i++) {
        centers[i] = minVal + (i + 0.5) * binWidth;
        counts[i] = hist.at<float>(i);
    }

    // Class weights and means for every split position, from both ends
    vector<double> weight1(nbins), mean1(nbins), weight2(nbins), mean2(nbins);
    double cumWeight = 0.0, cumSum = 0.0;
    for (int i = 0; i < nbins; i++) {
        cumWeight += counts[i];
        cumSum += counts[i] * centers[i];
        weight1[i] = cumWeight;
        mean1[i] = cumWeight > 0 ? cumSum / cumWeight : 0.0;
    }
    cumWeight = 0.0;
    cumSum = 0.0;
    for (int i = nbins - 1; i >= 0; i--) {
        cumWeight += counts[i];
        cumSum += counts[i] * centers[i];
        weight2[i] = cumWeight;
        mean2[i] = cumWeight > 0 ? cumSum / cumWeight : 0.0;
    }

    int bestIdx = -1;
    double bestVariance = 0.0;
    for (int i = 0; i < nbins - 1; i++) {
        double meanDiff = mean1[i] - mean2[i + 1];
        double variance = weight1[i] * weight2[i + 1] * meanDiff * meanDiff;
        if (variance > bestVariance) {
            bestVariance = variance;
            bestIdx = i;
        }
    }

    if (bestIdx < 0) {
        throw ThresholdingFailed("Otsu threshold undefined: histogram has no bimodal split");
    }
    return centers[bestIdx];
}

Mat Binarizer::fillHoles(const Mat& mask) {
    Mat binary = RegionAnalyzer::toBinaryMask(mask);
    if (binary.empty()) {
        return binary;
    }

    // Flood the background from outside the frame; whatever stays set is a hole
    Mat inverted;
    copyMakeBorder(binary, inverted, 1, 1, 1, 1, BORDER_CONSTANT, Scalar(0));
    bitwise_not(inverted, inverted);
    floodFill(inverted, Point(0, 0), Scalar(0), nullptr, Scalar(), Scalar(), 4);

    Mat holes = inverted(Rect(1, 1, binary.cols, binary.rows));
    Mat filled;
    bitwise_or(binary, holes, filled);
    return filled;
}

int Binarizer::findTagsEdge(const Mat& binary, int topRuler, const ProcessingParams& params) {
    if (binary.empty()) {
        throw invalid_argument("Binary image cannot be empty");
    }
    if (topRuler <= 0 || topRuler > binary.rows) {
        throw invalid_argument("top_ruler " + to_string(topRuler) + " outside image rows (0, "
                               + to_string(binary.rows) + "]");
    }

    int leftBound = static_cast<int>(binary.cols * params.tagAreaFraction);
    Mat focus = RegionAnalyzer::toBinaryMask(binary(Range(0, topRuler), Range(leftBound, binary.cols)));

    Mat focusFilled = fillHoles(focus);
    Mat focusEroded;
    if (params.tagErosionIterations > 0) {
        Mat kernel = getStructuringElement(MORPH_CROSS, Size(3, 3));
        erode(focusFilled, focusEroded, kernel, Point(-1, -1), params.tagErosionIterations);
    } else {
        focusEroded = focusFilled;
    }
    ImageUtils::pushDebugImage(focusEroded, "tag_window", params);

    vector<Region> regions = RegionAnalyzer::labelRegions(focusEroded);
    if (regions.empty()) {
        throw NoRegionsFound("No tag regions found above the ruler in the right part of the image");
    }

    // Area descending, then right edge descending, then scan order
    sort(regions.begin(), regions.end(), [](const Region& a, const Region& b) {
        if (a.area != b.area) return a.area > b.area;
        if (a.maxCol != b.maxCol) return a.maxCol > b.maxCol;
        return a.label < b.label;
    });

    size_t expected = static_cast<size_t>(params.maxTagRegions);
    if (regions.size() < expected) {
        warnAmbiguousRegionOrdering("tag edge detection", regions.size(), expected);
    }
    size_t used = min(regions.size(), expected);

    int minLeft = regions[0].minCol;
    for (size_t i = 1; i < used; i++) {
        minLeft = min(minLeft, regions[i].minCol);
    }

    int cropRight = leftBound + minLeft;
    if (params.verboseOutput) {
        cout << "[INFO] Tag edge at column " << cropRight << " (" << used << " of "
             << regions.size() << " tag regions used)" << endl;
    }
    return cropRight;
}

Mat Binarizer::saturationChannel(const Mat& bgrImg) {
    if (bgrImg.empty() || bgrImg.channels() != 3) {
        throw invalid_argument("Saturation needs a non-empty 3-channel image");
    }

    Mat hsv;
    cvtColor(ImageUtils::toUnitFloat(bgrImg), hsv, COLOR_BGR2HSV);
    Mat saturation;
    extractChannel(hsv, saturation, 1);
    return saturation;
}

Mat Binarizer::binarize(const Mat& bgrImg, int topRuler, const ProcessingParams& params) {
    if (bgrImg.empty()) {
        throw invalid_argument("Input image cannot be empty");
    }
    if (bgrImg.channels() != 3) {
        throw invalid_argument("Input image must have 3 channels, got " + to_string(bgrImg.channels()));
    }
    if (topRuler <= 0 || topRuler > bgrImg.rows) {
        throw invalid_argument("top_ruler " + to_string(topRuler) + " outside image rows (0, "
                               + to_string(bgrImg.rows) + "]");
    }
    validateParams(params);

    if (params.verboseOutput) {
        cout << "[INFO] Binarizing " << bgrImg.cols << "x" << bgrImg.rows
             << " image with ruler top at row " << topRuler << endl;
    }

    // First pass: red channel over the whole frame, to find the tags
    Mat red;
    extractChannel(ImageUtils::toUnitFloat(bgrImg), red, 2);
    double threshRed = otsuThreshold(red, params.firstPassBins);
    Mat binary = red > threshRed;
    if (params.verboseOutput) cout << "[INFO] First pass Otsu threshold: " << threshRed << endl;
    ImageUtils::pushDebugImage(binary, "first_pass", params);

    int labelEdge = findTagsEdge(binary, topRuler, params);
    if (labelEdge <= 0) {
        throw NoRegionsFound("Tag edge at column 0 leaves no specimen area");
    }

    // Second pass: rescaled saturation of the specimen area
    Mat bflyBgr = bgrImg(Rect(0, 0, labelEdge, topRuler));
    Mat saturation = saturationChannel(bflyBgr);
    Mat rescaled;
    normalize(saturation, rescaled, 0.0, 255.0, NORM_MINMAX, CV_32F);
    double threshHsv = otsuThreshold(rescaled, params.secondPassBins);
    Mat bflyBin = rescaled > threshHsv;
    if (params.verboseOutput) cout << "[INFO] Saturation Otsu threshold: " << threshHsv << endl;
    ImageUtils::pushDebugImage(bflyBin, "silhouette", params);

    return bflyBin;
}

Mat Binarizer::binarize(const Mat& bgrImg, int topRuler) {
    ProcessingParams params;
    return binarize(bgrImg, topRuler, params);
}

} // namespace MothTrace
