#pragma once

#include <opencv2/core.hpp>

namespace MothTrace {
namespace TestMasks {

// Sets rows [r0, r1] (inclusive) of column c.
inline void fillColumn(cv::Mat& mask, int c, int r0, int r1) {
    for (int r = r0; r <= r1; r++) {
        mask.at<uchar>(r, c) = 255;
    }
}

// Sets rows [r0, r1] x cols [c0, c1] (inclusive).
inline void fillRect(cv::Mat& mask, int r0, int c0, int r1, int c1) {
    mask(cv::Range(r0, r1 + 1), cv::Range(c0, c1 + 1)).setTo(255);
}

// 20x20 specimen: a one pixel wide body at column 10 flanked by two mirrored
// triangular wings. Wingtips at (2,3) and (2,17), shoulders at (14,8) and
// (14,12), body rows 5..17. The wing bases meet the body at rows 14..17.
//
//   ....................
//   ....................
//   ...#####.....#####..
//   ....####.....####...
//   ....####.....####...
//   ....####..#..####...
//   ....####..#..####...
//   .....###..#..###....
//   .....###..#..###....
//   .....###..#..###....
//   .....###..#..###....
//   ......##..#..##.....
//   ......##..#..##.....
//   ......##..#..##.....
//   ......##.###.##.....
//   .......#######......
//   .......#######......
//   .......#######......
//   ....................
//   ....................
inline cv::Mat symmetricWings() {
    cv::Mat mask = cv::Mat::zeros(20, 20, CV_8UC1);

    fillColumn(mask, 10, 5, 17);

    // Wing bases
    fillColumn(mask, 9, 14, 17);
    fillColumn(mask, 11, 14, 17);
    fillColumn(mask, 8, 15, 17);
    fillColumn(mask, 12, 15, 17);

    // Triangles: column, lowest row (all start at row 2)
    const int bottoms[5][2] = {{3, 2}, {4, 6}, {5, 10}, {6, 14}, {7, 17}};
    for (const auto& b : bottoms) {
        fillColumn(mask, b[0], 2, b[1]);
        fillColumn(mask, 20 - b[0], 2, b[1]);
    }
    return mask;
}

// 40x40 wing half with a one pixel antenna loop on top of a solid wing.
// The loop (rows 2..9, cols 12..18) encloses a background hole at rows 3..8, cols 13..17.
inline cv::Mat wingWithAntennaLoop() {
    cv::Mat mask = cv::Mat::zeros(40, 40, CV_8UC1);
    fillRect(mask, 10, 5, 30, 25);
    fillRect(mask, 2, 12, 2, 18);
    fillRect(mask, 9, 12, 9, 18);
    fillColumn(mask, 12, 2, 9);
    fillColumn(mask, 18, 2, 9);
    return mask;
}

} // namespace TestMasks
} // namespace MothTrace
