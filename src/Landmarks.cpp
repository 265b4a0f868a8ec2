#include "Landmarks.hpp"
#include <opencv2/core/persistence.hpp>
#include <sstream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace MothTrace {

const vector<string>& LandmarksResult::keys() {
    static const vector<string> names = {
        "outer_pix_l", "inner_pix_l", "outer_pix_r", "inner_pix_r", "body_center"
    };
    return names;
}

LandmarksResult::LandmarksResult(const PixelCoord& outerPixL, const PixelCoord& innerPixL,
                                 const PixelCoord& outerPixR, const PixelCoord& innerPixR,
                                 const PixelCoord& bodyCenter)
    : m_outerPixL(outerPixL), m_innerPixL(innerPixL),
      m_outerPixR(outerPixR), m_innerPixR(innerPixR),
      m_bodyCenter(bodyCenter) {
}

const PixelCoord& LandmarksResult::at(const string& key) const {
    if (key == "outer_pix_l") return m_outerPixL;
    if (key == "inner_pix_l") return m_innerPixL;
    if (key == "outer_pix_r") return m_outerPixR;
    if (key == "inner_pix_r") return m_innerPixR;
    if (key == "body_center") return m_bodyCenter;
    throw out_of_range("Unknown landmark key: " + key);
}

vector<pair<string, PixelCoord>> LandmarksResult::entries() const {
    vector<pair<string, PixelCoord>> result;
    for (const auto& key : keys()) {
        result.emplace_back(key, at(key));
    }
    return result;
}

string LandmarksResult::toString() const {
    ostringstream out;
    for (const auto& [key, p] : entries()) {
        out << "  " << key << ": (" << p.row << ", " << p.col << ")\n";
    }
    return out.str();
}

bool LandmarksResult::operator==(const LandmarksResult& other) const {
    return m_outerPixL == other.m_outerPixL && m_innerPixL == other.m_innerPixL
        && m_outerPixR == other.m_outerPixR && m_innerPixR == other.m_innerPixR
        && m_bodyCenter == other.m_bodyCenter;
}

void writeLandmarks(const LandmarksResult& result, const string& path) {
    FileStorage fs(path, FileStorage::WRITE);
    if (!fs.isOpened()) {
        throw runtime_error("Failed to open landmark file for writing: " + path);
    }
    for (const auto& [key, p] : result.entries()) {
        fs << key << "[:" << p.row << p.col << "]";
    }
    fs.release();
}

LandmarksResult readLandmarks(const string& path) {
    FileStorage fs(path, FileStorage::READ);
    if (!fs.isOpened()) {
        throw runtime_error("Failed to open landmark file: " + path);
    }

    vector<PixelCoord> points;
    for (const auto& key : LandmarksResult::keys()) {
        FileNode node = fs[key];
        if (node.empty() || !node.isSeq() || node.size() != 2) {
            throw runtime_error("Landmark file " + path + " has no valid entry for " + key);
        }
        points.push_back(PixelCoord{static_cast<int>(node[0]), static_cast<int>(node[1])});
    }
    return LandmarksResult(points[0], points[1], points[2], points[3], points[4]);
}

} // namespace MothTrace
