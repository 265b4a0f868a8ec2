#include "ResultCache.hpp"
#include "Binarizer.hpp"
#include "LandmarkDetector.hpp"
#include <opencv2/core/persistence.hpp>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <functional>
#include <stdexcept>
#include <thread>

using namespace cv;
using namespace std;

namespace MothTrace {

namespace {

    const uint64_t kFnvOffset = 14695981039346656037ULL;
    const uint64_t kFnvPrime = 1099511628211ULL;

    void hashBytes(uint64_t& hash, const void* data, size_t length) {
        const unsigned char* bytes = static_cast<const unsigned char*>(data);
        for (size_t i = 0; i < length; i++) {
            hash ^= bytes[i];
            hash *= kFnvPrime;
        }
    }

    template <typename T>
    void hashValue(uint64_t& hash, const T& value) {
        hashBytes(hash, &value, sizeof(value));
    }

    // Header and pixel bytes; non-continuous matrices are hashed row by row
    void hashMat(uint64_t& hash, const Mat& mat) {
        hashValue(hash, mat.rows);
        hashValue(hash, mat.cols);
        hashValue(hash, mat.type());
        size_t rowBytes = mat.cols * mat.elemSize();
        for (int r = 0; r < mat.rows; r++) {
            hashBytes(hash, mat.ptr(r), rowBytes);
        }
    }

    string toHex(uint64_t hash) {
        char buf[17];
        snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
        return string(buf);
    }

    Mat landmarksToMat(const LandmarksResult& result) {
        Mat values(5, 2, CV_32S);
        int i = 0;
        for (const auto& entry : result.entries()) {
            values.at<int>(i, 0) = entry.second.row;
            values.at<int>(i, 1) = entry.second.col;
            i++;
        }
        return values;
    }

    LandmarksResult matToLandmarks(const Mat& values) {
        if (values.rows != 5 || values.cols != 2 || values.type() != CV_32S) {
            throw runtime_error("Cached landmark entry has an unexpected layout");
        }
        auto point = [&values](int i) {
            return PixelCoord{values.at<int>(i, 0), values.at<int>(i, 1)};
        };
        return LandmarksResult(point(0), point(1), point(2), point(3), point(4));
    }
}

bool InMemoryResultCache::lookup(const string& key, Mat& value) const {
    lock_guard<mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return false;
    }
    value = it->second.clone();
    return true;
}

void InMemoryResultCache::store(const string& key, const Mat& value) {
    lock_guard<mutex> lock(m_mutex);
    m_entries[key] = value.clone();
}

size_t InMemoryResultCache::size() const {
    lock_guard<mutex> lock(m_mutex);
    return m_entries.size();
}

void InMemoryResultCache::clear() {
    lock_guard<mutex> lock(m_mutex);
    m_entries.clear();
}

DirectoryResultCache::DirectoryResultCache(string directory)
    : m_directory(std::move(directory)) {
}

string DirectoryResultCache::entryPath(const string& key) const {
    return (filesystem::path(m_directory) / (key + ".yml.gz")).string();
}

bool DirectoryResultCache::lookup(const string& key, Mat& value) const {
    string path = entryPath(key);
    std::error_code ec;
    if (!filesystem::exists(path, ec)) {
        return false;
    }

    // A truncated or foreign file makes the FileStorage parser throw
    Mat stored;
    try {
        FileStorage fs(path, FileStorage::READ);
        if (!fs.isOpened()) {
            cerr << "[WARN] Unreadable cache entry " << path << "; recomputing" << endl;
            return false;
        }
        fs["value"] >> stored;
    } catch (const cv::Exception& e) {
        cerr << "[WARN] Corrupt cache entry " << path << " (" << e.what() << "); recomputing" << endl;
        return false;
    }

    if (stored.empty()) {
        cerr << "[WARN] Empty cache entry " << path << "; recomputing" << endl;
        return false;
    }
    value = stored;
    return true;
}

void DirectoryResultCache::store(const string& key, const Mat& value) {
    std::error_code ec;
    filesystem::create_directories(m_directory, ec);
    if (ec) {
        cerr << "[WARN] Could not create cache directory " << m_directory << ": " << ec.message() << endl;
        return;
    }

    // Written beside the entry, then renamed, so readers never see a partial file.
    // The suffix keeps the .yml.gz extension FileStorage picks its format from.
    string path = entryPath(key);
    size_t writer = hash<thread::id>()(this_thread::get_id());
    string tmpPath = (filesystem::path(m_directory) / (key + ".tmp" + to_string(writer) + ".yml.gz")).string();
    try {
        FileStorage fs(tmpPath, FileStorage::WRITE);
        if (!fs.isOpened()) {
            cerr << "[WARN] Could not write cache entry " << tmpPath << endl;
            return;
        }
        fs << "value" << value;
        fs.release();
    } catch (const cv::Exception& e) {
        cerr << "[WARN] Could not write cache entry " << tmpPath << ": " << e.what() << endl;
        filesystem::remove(tmpPath, ec);
        return;
    }

    filesystem::rename(tmpPath, path, ec);
    if (ec) {
        cerr << "[WARN] Could not move cache entry into place " << path << ": " << ec.message() << endl;
        filesystem::remove(tmpPath, ec);
    }
}

string fingerprintImage(const Mat& image, int topRuler, const ProcessingParams& params) {
    uint64_t hash = kFnvOffset;
    hashMat(hash, image);
    hashValue(hash, topRuler);
    hashValue(hash, params.firstPassBins);
    hashValue(hash, params.secondPassBins);
    hashValue(hash, params.tagAreaFraction);
    hashValue(hash, params.maxTagRegions);
    hashValue(hash, params.tagErosionIterations);
    return "binarize_" + toHex(hash);
}

string fingerprintMask(const Mat& mask, const ProcessingParams& params) {
    uint64_t hash = kFnvOffset;
    hashMat(hash, RegionAnalyzer::toBinaryMask(mask));
    hashValue(hash, params.antennaDilationIterations);
    hashValue(hash, params.innerSearchHeightFraction);
    return "landmarks_" + toHex(hash);
}

Mat binarizeCached(const Mat& bgrImg, int topRuler, const ProcessingParams& params, ResultCache* cache) {
    if (cache == nullptr) {
        return Binarizer::binarize(bgrImg, topRuler, params);
    }

    string key = fingerprintImage(bgrImg, topRuler, params);
    Mat cached;
    if (cache->lookup(key, cached)) {
        if (params.verboseOutput) cout << "[INFO] Silhouette cache hit: " << key << endl;
        return cached;
    }

    Mat result = Binarizer::binarize(bgrImg, topRuler, params);
    cache->store(key, result);
    return result;
}

LandmarksResult detectLandmarksCached(const Mat& binary, const ProcessingParams& params,
                                      ResultCache* cache, const vector<RenderSurface*>& surfaces) {
    if (cache == nullptr) {
        return LandmarkDetector::detectLandmarks(binary, params, surfaces);
    }

    bool drawing = false;
    for (const auto* surface : surfaces) {
        if (surface != nullptr) drawing = true;
    }

    string key = fingerprintMask(binary, params);
    Mat cached;
    if (!drawing && cache->lookup(key, cached)) {
        if (params.verboseOutput) cout << "[INFO] Landmark cache hit: " << key << endl;
        return matToLandmarks(cached);
    }

    LandmarksResult result = LandmarkDetector::detectLandmarks(binary, params, surfaces);
    cache->store(key, landmarksToMat(result));
    return result;
}

} // namespace MothTrace
