#pragma once

#include "Landmarks.hpp"
#include "ProcessingParams.hpp"
#include "RenderSurface.hpp"
#include <map>
#include <mutex>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace MothTrace {

// Key-value store for results of the pure pipeline entry points.
class ResultCache {
public:
    virtual ~ResultCache() = default;

    // Returns false on a miss and leaves value untouched.
    virtual bool lookup(const std::string& key, cv::Mat& value) const = 0;
    virtual void store(const std::string& key, const cv::Mat& value) = 0;
};

class InMemoryResultCache : public ResultCache {
public:
    bool lookup(const std::string& key, cv::Mat& value) const override;
    void store(const std::string& key, const cv::Mat& value) override;

    size_t size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::map<std::string, cv::Mat> m_entries;
};

// One compressed cv::FileStorage file per entry. The directory is created on
// the first store.
class DirectoryResultCache : public ResultCache {
public:
    explicit DirectoryResultCache(std::string directory = "./cachedir");

    bool lookup(const std::string& key, cv::Mat& value) const override;
    void store(const std::string& key, const cv::Mat& value) override;

    const std::string& directory() const { return m_directory; }

private:
    std::string entryPath(const std::string& key) const;

    std::string m_directory;
};

// Deterministic digests of the pipeline inputs, including the parameters that
// change the result.
std::string fingerprintImage(const cv::Mat& image, int topRuler, const ProcessingParams& params);
std::string fingerprintMask(const cv::Mat& mask, const ProcessingParams& params);

// Cached entry points. A null cache computes directly.
cv::Mat binarizeCached(const cv::Mat& bgrImg, int topRuler, const ProcessingParams& params,
                       ResultCache* cache);

// Drawing is a side effect, so a lookup is skipped when a render surface is
// given; the computed result is still stored.
LandmarksResult detectLandmarksCached(const cv::Mat& binary, const ProcessingParams& params,
                                      ResultCache* cache,
                                      const std::vector<RenderSurface*>& surfaces = {});

} // namespace MothTrace
