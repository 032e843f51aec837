#pragma once
#include "preprocess.hpp"
#include <opencv2/opencv.hpp>
#include <cstdint>
#include <vector>

namespace overlay {
    struct Rgba {
        uint8_t r, g, b, a;
    };

    // translucent green used for foreground patches
    constexpr Rgba kHighlight = {30, 255, 150, 170};

    // One RGBA pixel per patch (CV_8UC4, hPatches rows, wPatches cols):
    // `color` where score > threshold, fully transparent elsewhere.
    cv::Mat render(const std::vector<float>&    scores,
                   const preprocess::PatchGrid& grid,
                   float                        threshold,
                   Rgba                         color = kHighlight);

    // Presentation helper: scales an RGBA patch mask to the size of a BGR
    // frame (nearest neighbour) and alpha-blends it in place.
    void blend(cv::Mat& bgrFrame, const cv::Mat& rgbaMask);
}
