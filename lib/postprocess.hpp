#pragma once
#include "preprocess.hpp"
#include <vector>

namespace postprocess
{
    // Zeroes every score outside the largest 8-connected region of patches
    // scoring above `threshold`. Ties go to the region found first in
    // row-major scan order. Returns false and leaves the scores untouched
    // when no patch is above the threshold.
    bool keepLargestRegion(std::vector<float>&         scores,
                           const preprocess::PatchGrid& grid,
                           float                        threshold);

    // Applies the configured post-processing. Without the area filter the
    // scores pass through; thresholding for display happens in the renderer.
    void apply(std::vector<float>&         scores,
               const preprocess::PatchGrid& grid,
               float                        threshold,
               bool                         largestAreaOnly);
}
