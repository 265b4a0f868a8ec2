#include "Binarizer.hpp"
#include "LandmarkDetector.hpp"
#include "MothTraceErrors.hpp"
#include "ResultCache.hpp"
#include "TestMasks.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace MothTrace;
namespace fs = std::filesystem;

namespace {

// Counts lookups and stores around an in-memory cache.
class CountingCache : public ResultCache {
public:
    bool lookup(const std::string& key, cv::Mat& value) const override {
        lookups++;
        bool hit = m_inner.lookup(key, value);
        if (hit) hits++;
        return hit;
    }
    void store(const std::string& key, const cv::Mat& value) override {
        stores++;
        m_inner.store(key, value);
    }

    mutable int lookups = 0;
    mutable int hits = 0;
    int stores = 0;

private:
    InMemoryResultCache m_inner;
};

cv::Mat syntheticPhoto() {
    cv::Mat img(100, 200, CV_8UC3, cv::Scalar(20, 20, 20));
    img(cv::Rect(150, 10, 40, 31)).setTo(cv::Scalar(240, 240, 240));
    img(cv::Rect(30, 20, 81, 41)).setTo(cv::Scalar(200, 50, 20));
    return img;
}

}

TEST(FingerprintTest, DeterministicAndSensitive) {
    cv::Mat img = syntheticPhoto();
    ProcessingParams params;

    std::string key = fingerprintImage(img, 80, params);
    EXPECT_EQ(key, fingerprintImage(img.clone(), 80, params));
    EXPECT_NE(key, fingerprintImage(img, 79, params));

    ProcessingParams other;
    other.tagErosionIterations = 0;
    EXPECT_NE(key, fingerprintImage(img, 80, other));

    cv::Mat changed = img.clone();
    changed.at<cv::Vec3b>(99, 199)[0] = 21;
    EXPECT_NE(key, fingerprintImage(changed, 80, params));
}

TEST(FingerprintTest, MaskDigestIgnoresOutputOnlyParams) {
    cv::Mat mask = TestMasks::symmetricWings();
    ProcessingParams params;
    ProcessingParams verbose;
    verbose.verboseOutput = true;
    ProcessingParams narrow;
    narrow.antennaDilationIterations = 5;

    EXPECT_EQ(fingerprintMask(mask, params), fingerprintMask(mask, verbose));
    EXPECT_NE(fingerprintMask(mask, params), fingerprintMask(mask, narrow));
    EXPECT_NE(fingerprintMask(mask, params), fingerprintImage(mask, 10, params));
}

TEST(FingerprintTest, SubmatrixHashesLikeItsCopy) {
    cv::Mat mask = TestMasks::symmetricWings();
    ProcessingParams params;

    cv::Mat view = mask.colRange(0, 10);
    EXPECT_EQ(fingerprintMask(view, params), fingerprintMask(view.clone(), params));
}

TEST(InMemoryResultCacheTest, StoreAndLookup) {
    InMemoryResultCache cache;
    cv::Mat value = (cv::Mat_<int>(1, 3) << 1, 2, 3);

    cv::Mat out;
    EXPECT_FALSE(cache.lookup("k", out));
    EXPECT_TRUE(out.empty());

    cache.store("k", value);
    ASSERT_TRUE(cache.lookup("k", out));
    EXPECT_EQ(cv::countNonZero(out != value), 0);
    EXPECT_EQ(cache.size(), 1u);

    // Entries are copies
    value.at<int>(0, 0) = 9;
    cache.lookup("k", out);
    EXPECT_EQ(out.at<int>(0, 0), 1);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(CachedPipelineTest, BinarizeHitsOnSecondCall) {
    CountingCache cache;
    cv::Mat img = syntheticPhoto();
    ProcessingParams params;

    cv::Mat first = binarizeCached(img, 80, params, &cache);
    cv::Mat second = binarizeCached(img, 80, params, &cache);

    EXPECT_EQ(cache.stores, 1);
    EXPECT_EQ(cache.hits, 1);
    EXPECT_EQ(cv::countNonZero(first != second), 0);
    EXPECT_EQ(cv::countNonZero(first != Binarizer::binarize(img, 80, params)), 0);
}

TEST(CachedPipelineTest, NullCacheComputesDirectly) {
    cv::Mat mask = TestMasks::symmetricWings();
    ProcessingParams params;

    EXPECT_EQ(detectLandmarksCached(mask, params, nullptr), LandmarkDetector::detectLandmarks(mask, params));
}

TEST(CachedPipelineTest, LandmarksHitOnSecondCall) {
    CountingCache cache;
    cv::Mat mask = TestMasks::symmetricWings();
    ProcessingParams params;

    LandmarksResult first = detectLandmarksCached(mask, params, &cache);
    LandmarksResult second = detectLandmarksCached(mask, params, &cache);

    EXPECT_EQ(cache.hits, 1);
    EXPECT_EQ(first, second);
    EXPECT_EQ(second.innerPixR(), (PixelCoord{14, 12}));
}

TEST(CachedPipelineTest, DrawingBypassesLookup) {
    CountingCache cache;
    cv::Mat mask = TestMasks::symmetricWings();
    ProcessingParams params;
    detectLandmarksCached(mask, params, &cache);

    MatRenderSurface canvas;
    LandmarksResult drawn = detectLandmarksCached(mask, params, &cache, {nullptr, nullptr, &canvas});

    EXPECT_EQ(cache.lookups, 1);
    EXPECT_EQ(cache.stores, 2);
    EXPECT_FALSE(canvas.empty());
    EXPECT_EQ(drawn, LandmarkDetector::detectLandmarks(mask, params));
}

TEST(CachedPipelineTest, FailuresAreNotCached) {
    CountingCache cache;
    cv::Mat mask = cv::Mat::zeros(20, 20, CV_8UC1);
    ProcessingParams params;

    EXPECT_THROW(detectLandmarksCached(mask, params, &cache), NoRegionsFound);
    EXPECT_EQ(cache.stores, 0);
}

TEST(DirectoryResultCacheTest, PersistsAcrossInstances) {
    fs::path dir = fs::temp_directory_path() / "mothtrace_cache_test";
    std::error_code ec;
    fs::remove_all(dir, ec);

    cv::Mat mask = TestMasks::symmetricWings();
    ProcessingParams params;
    {
        DirectoryResultCache cache(dir.string());
        cv::Mat out;
        EXPECT_FALSE(cache.lookup("missing", out));
        detectLandmarksCached(mask, params, &cache);
    }

    DirectoryResultCache reopened(dir.string());
    cv::Mat stored;
    ASSERT_TRUE(reopened.lookup(fingerprintMask(mask, params), stored));
    EXPECT_EQ(stored.rows, 5);
    EXPECT_EQ(stored.cols, 2);
    EXPECT_EQ(stored.type(), CV_32S);
    EXPECT_EQ(detectLandmarksCached(mask, params, &reopened), LandmarkDetector::detectLandmarks(mask, params));

    fs::remove_all(dir, ec);
}

TEST(DirectoryResultCacheTest, CorruptEntryIsRecomputed) {
    fs::path dir = fs::temp_directory_path() / "mothtrace_cache_corrupt";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);

    cv::Mat mask = TestMasks::symmetricWings();
    ProcessingParams params;
    DirectoryResultCache cache(dir.string());
    EXPECT_EQ(cache.directory(), dir.string());

    std::string key = fingerprintMask(mask, params);
    std::ofstream(dir / (key + ".yml.gz")) << "garbage\n";

    cv::Mat out;
    EXPECT_FALSE(cache.lookup(key, out));
    EXPECT_TRUE(out.empty());

    LandmarksResult result = detectLandmarksCached(mask, params, &cache);
    EXPECT_EQ(result, LandmarkDetector::detectLandmarks(mask, params));

    // The bad entry was replaced and no temporary file is left behind
    ASSERT_TRUE(cache.lookup(key, out));
    EXPECT_EQ(out.rows, 5);
    int files = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        EXPECT_EQ(entry.path().filename().string(), key + ".yml.gz");
        files++;
    }
    EXPECT_EQ(files, 1);

    fs::remove_all(dir, ec);
}
