#include "ImageUtils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace MothTrace {

Mat ImageUtils::loadImage(const string& path) {
    if (path.empty()) {
        throw invalid_argument("Image path cannot be empty");
    }

    cout << "[INFO] Loading image from: " << path << endl;
    Mat img = imread(path, IMREAD_COLOR);
    if (img.empty()) {
        cerr << "[ERROR] Could not load image from " << path << endl;
        cerr << "[ERROR] Please check that the file exists and is a valid image format" << endl;
        throw runtime_error("Failed to load image: " + path);
    }

    cout << "[INFO] Image loaded successfully. Shape: " << img.rows << " x " << img.cols << endl;
    return img;
}

Mat ImageUtils::toUnitFloat(const Mat& img) {
    Mat out;
    switch (img.depth()) {
        case CV_8U:
            img.convertTo(out, CV_32F, 1.0 / 255.0);
            break;
        case CV_16U:
            img.convertTo(out, CV_32F, 1.0 / 65535.0);
            break;
        case CV_32F:
            out = img;
            break;
        case CV_64F:
            img.convertTo(out, CV_32F);
            break;
        default:
            throw invalid_argument("Unsupported image depth");
    }
    return out;
}

void ImageUtils::pushDebugImage(const Mat& image, const string& name, const ProcessingParams& params) {
    if (!params.enableDebugOutput) return;

    // Push a copy of the image and name onto the stack
    params.debugImageStack.emplace_back(image.clone(), name);
}

void ImageUtils::flushDebugStack(const ProcessingParams& params) {
    if (!params.enableDebugOutput || params.debugImageStack.empty()) return;

    cout << "[DEBUG] Flushing " << params.debugImageStack.size() << " debug images..." << endl;

    std::error_code ec;
    filesystem::create_directories(params.debugOutputPath, ec);
    if (ec) {
        cout << "[WARNING] Could not create debug directory " << params.debugOutputPath
             << ": " << ec.message() << endl;
    }

    // Save all images with sequential numbering
    for (size_t i = 0; i < params.debugImageStack.size(); i++) {
        const auto& [image, name] = params.debugImageStack[i];

        // Format: 01_name.jpg, 02_name.jpg, etc.
        char indexStr[8];
        snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
        string filename = string(indexStr) + "_" + name + ".jpg";
        string fullPath = (filesystem::path(params.debugOutputPath) / filename).string();

        bool success = imwrite(fullPath, image);
        if (success) {
            cout << "[DEBUG] Saved: " << filename << endl;
        } else {
            cout << "[WARNING] Failed to save: " << filename << endl;
        }
    }

    params.debugImageStack.clear();
    cout << "[DEBUG] Debug stack flushed and cleared" << endl;
}

} // namespace MothTrace
