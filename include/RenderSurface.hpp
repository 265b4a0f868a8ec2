#pragma once

#include "RegionAnalyzer.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace MothTrace {

// Write-only drawing target for landmark overlays. Nothing drawn here is ever
// read back by the pipeline.
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    virtual void setTitle(const std::string& title) = 0;
    virtual void showImage(const cv::Mat& image) = 0;
    virtual void drawDashedVerticalLine(int col, const cv::Scalar& color) = 0;
    virtual void scatter(const std::vector<PixelCoord>& points, const cv::Scalar& color, int markerSize) = 0;
};

// Renders onto a BGR canvas that can be saved with cv::imwrite.
class MatRenderSurface : public RenderSurface {
public:
    void setTitle(const std::string& title) override;
    void showImage(const cv::Mat& image) override;
    void drawDashedVerticalLine(int col, const cv::Scalar& color) override;
    void scatter(const std::vector<PixelCoord>& points, const cv::Scalar& color, int markerSize) override;

    const cv::Mat& canvas() const { return m_canvas; }
    const std::string& title() const { return m_title; }
    bool empty() const { return m_canvas.empty(); }

    // Canvas with the title printed in the top-left corner.
    cv::Mat render() const;
    bool save(const std::string& path) const;

private:
    cv::Mat m_canvas;
    std::string m_title;
};

} // namespace MothTrace
