#include "RenderSurface.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace cv;
using namespace std;

namespace MothTrace {

void MatRenderSurface::setTitle(const string& title) {
    m_title = title;
}

void MatRenderSurface::showImage(const Mat& image) {
    Mat display;
    if (image.depth() != CV_8U) {
        normalize(image, display, 0, 255, NORM_MINMAX, CV_8U);
    } else {
        display = image;
    }

    if (display.channels() == 1) {
        cvtColor(display, m_canvas, COLOR_GRAY2BGR);
    } else {
        m_canvas = display.clone();
    }
}

void MatRenderSurface::drawDashedVerticalLine(int col, const Scalar& color) {
    if (m_canvas.empty()) {
        cerr << "[WARN] Dashed line drawn before an image was shown; ignored" << endl;
        return;
    }

    const int dashLength = 4;
    for (int y = 0; y < m_canvas.rows; y += 2 * dashLength) {
        int yEnd = min(y + dashLength - 1, m_canvas.rows - 1);
        line(m_canvas, Point(col, y), Point(col, yEnd), color, 1);
    }
}

void MatRenderSurface::scatter(const vector<PixelCoord>& points, const Scalar& color, int markerSize) {
    if (m_canvas.empty()) {
        cerr << "[WARN] Scatter drawn before an image was shown; ignored" << endl;
        return;
    }

    // markerSize is an area, like a scatter plot's s parameter
    int radius = max(1, static_cast<int>(std::round(std::sqrt(static_cast<double>(markerSize)) / 2.0)));
    for (const auto& p : points) {
        circle(m_canvas, p.toPoint(), radius, color, FILLED);
    }
}

Mat MatRenderSurface::render() const {
    Mat out = m_canvas.clone();
    if (!out.empty() && !m_title.empty()) {
        putText(out, m_title, Point(5, 15), FONT_HERSHEY_SIMPLEX, 0.5, Scalar(255, 255, 255), 1);
    }
    return out;
}

bool MatRenderSurface::save(const string& path) const {
    if (m_canvas.empty()) {
        cerr << "[ERROR] Nothing rendered, not saving " << path << endl;
        return false;
    }
    try {
        if (!imwrite(path, render())) {
            cerr << "[ERROR] Failed to save overlay: " << path << endl;
            return false;
        }
    } catch (const cv::Exception& e) {
        cerr << "[ERROR] Exception while saving overlay: " << e.what() << endl;
        return false;
    }

    cout << "[INFO] Overlay saved to: " << path << endl;
    return true;
}

} // namespace MothTrace
