#include "RegionAnalyzer.hpp"
#include "MothTraceErrors.hpp"
#include "TestMasks.hpp"
#include <gtest/gtest.h>

using namespace MothTrace;

TEST(RegionAnalyzerTest, EmptyMaskHasNoRegions) {
    cv::Mat mask = cv::Mat::zeros(8, 8, CV_8UC1);
    EXPECT_TRUE(RegionAnalyzer::labelRegions(mask).empty());
    EXPECT_TRUE(RegionAnalyzer::labelRegions(cv::Mat()).empty());
}

TEST(RegionAnalyzerTest, DiagonalNeighborsAreSeparateRegions) {
    cv::Mat mask = cv::Mat::zeros(4, 4, CV_8UC1);
    mask.at<uchar>(1, 1) = 255;
    mask.at<uchar>(2, 2) = 255;

    auto regions = RegionAnalyzer::labelRegions(mask);
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0].area, 1);
    EXPECT_EQ(regions[1].area, 1);
}

TEST(RegionAnalyzerTest, RegionsFollowScanOrder) {
    cv::Mat mask = cv::Mat::zeros(10, 10, CV_8UC1);
    // The large block starts lower, so the small one is met first
    TestMasks::fillRect(mask, 5, 0, 9, 9);
    TestMasks::fillRect(mask, 1, 6, 2, 7);

    auto regions = RegionAnalyzer::labelRegions(mask);
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0].label, 1);
    EXPECT_EQ(regions[0].area, 4);
    EXPECT_EQ(regions[0].minRow, 1);
    EXPECT_EQ(regions[0].minCol, 6);
    EXPECT_EQ(regions[0].maxRow, 2);
    EXPECT_EQ(regions[0].maxCol, 7);
    EXPECT_EQ(regions[1].label, 2);
    EXPECT_EQ(regions[1].area, 50);
    EXPECT_EQ(regions[1].bbox(), cv::Rect(0, 5, 10, 5));
}

TEST(RegionAnalyzerTest, CoordsAreInRowMajorOrder) {
    cv::Mat mask = cv::Mat::zeros(5, 5, CV_8UC1);
    TestMasks::fillRect(mask, 1, 1, 2, 3);

    auto regions = RegionAnalyzer::labelRegions(mask);
    ASSERT_EQ(regions.size(), 1u);
    const auto& coords = regions[0].coords;
    ASSERT_EQ(coords.size(), 6u);
    EXPECT_EQ(coords.front(), (PixelCoord{1, 1}));
    EXPECT_EQ(coords[3], (PixelCoord{2, 1}));
    EXPECT_EQ(coords.back(), (PixelCoord{2, 3}));
}

TEST(RegionAnalyzerTest, BackgroundRegionsOfRing) {
    cv::Mat mask = cv::Mat::zeros(7, 7, CV_8UC1);
    TestMasks::fillRect(mask, 1, 1, 5, 5);
    mask.at<uchar>(3, 3) = 0;

    auto regions = RegionAnalyzer::labelBackgroundRegions(mask);
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0].area, 24);
    EXPECT_EQ(regions[1].area, 1);
    EXPECT_EQ(regions[1].coords.front(), (PixelCoord{3, 3}));
}

TEST(RegionAnalyzerTest, NonBinaryValuesCountAsForeground) {
    cv::Mat mask = cv::Mat::zeros(3, 3, CV_32F);
    mask.at<float>(0, 0) = 0.5f;
    mask.at<float>(0, 1) = 1.0f;

    auto regions = RegionAnalyzer::labelRegions(mask);
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0].area, 2);
}

TEST(RegionAnalyzerTest, MultiChannelMaskIsRejected) {
    cv::Mat mask = cv::Mat::zeros(3, 3, CV_8UC3);
    EXPECT_THROW(RegionAnalyzer::labelRegions(mask), std::invalid_argument);
}

TEST(RegionAnalyzerTest, LargestRegionPrefersEarlierOnTies) {
    cv::Mat mask = cv::Mat::zeros(6, 6, CV_8UC1);
    TestMasks::fillRect(mask, 0, 0, 1, 1);
    TestMasks::fillRect(mask, 4, 4, 5, 5);

    auto regions = RegionAnalyzer::labelRegions(mask);
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(RegionAnalyzer::largestRegion(regions).label, 1);
}

TEST(RegionAnalyzerTest, LargestRegionOfNothingThrows) {
    std::vector<Region> none;
    EXPECT_THROW(RegionAnalyzer::largestRegion(none), NoRegionsFound);
}

TEST(RegionAnalyzerTest, SortByAreaBreaksTiesByScanOrder) {
    cv::Mat mask = cv::Mat::zeros(10, 10, CV_8UC1);
    TestMasks::fillRect(mask, 0, 0, 0, 1);   // area 2, label 1
    TestMasks::fillRect(mask, 0, 5, 2, 7);   // area 9, label 2
    TestMasks::fillRect(mask, 5, 0, 5, 1);   // area 2, label 3

    auto sorted = RegionAnalyzer::sortByAreaDescending(RegionAnalyzer::labelRegions(mask));
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0].label, 2);
    EXPECT_EQ(sorted[1].label, 1);
    EXPECT_EQ(sorted[2].label, 3);
}

TEST(RegionAnalyzerTest, RegionMaskRoundTrip) {
    cv::Mat mask = TestMasks::symmetricWings();
    auto regions = RegionAnalyzer::labelRegions(mask);
    ASSERT_EQ(regions.size(), 1u);

    cv::Mat rebuilt = RegionAnalyzer::regionMask(regions[0], mask.size());
    EXPECT_EQ(cv::countNonZero(rebuilt != mask), 0);
}
