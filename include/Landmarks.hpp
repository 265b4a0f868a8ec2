#pragma once

#include "RegionAnalyzer.hpp"
#include <string>
#include <utility>
#include <vector>

namespace MothTrace {

enum class WingSide { Left, Right };

// The five landmarks of a specimen, in whole-silhouette (row, col) coordinates.
class LandmarksResult {
public:
    static const std::vector<std::string>& keys();

    LandmarksResult() = default;
    LandmarksResult(const PixelCoord& outerPixL, const PixelCoord& innerPixL,
                    const PixelCoord& outerPixR, const PixelCoord& innerPixR,
                    const PixelCoord& bodyCenter);

    const PixelCoord& outerPixL() const { return m_outerPixL; }
    const PixelCoord& innerPixL() const { return m_innerPixL; }
    const PixelCoord& outerPixR() const { return m_outerPixR; }
    const PixelCoord& innerPixR() const { return m_innerPixR; }
    const PixelCoord& bodyCenter() const { return m_bodyCenter; }

    // Lookup by key name ("outer_pix_l", ...). Throws std::out_of_range for unknown keys.
    const PixelCoord& at(const std::string& key) const;

    // (key, point) pairs in the order of keys().
    std::vector<std::pair<std::string, PixelCoord>> entries() const;

    std::string toString() const;

    bool operator==(const LandmarksResult& other) const;
    bool operator!=(const LandmarksResult& other) const { return !(*this == other); }

private:
    PixelCoord m_outerPixL;
    PixelCoord m_innerPixL;
    PixelCoord m_outerPixR;
    PixelCoord m_innerPixR;
    PixelCoord m_bodyCenter;
};

// YAML or JSON depending on the file extension (cv::FileStorage).
void writeLandmarks(const LandmarksResult& result, const std::string& path);
LandmarksResult readLandmarks(const std::string& path);

} // namespace MothTrace
