#include "postprocess.hpp"
#include "errors.hpp"

namespace postprocess
{
    bool keepLargestRegion(std::vector<float>&         scores,
                           const preprocess::PatchGrid& grid,
                           float                        threshold)
    {
        if (scores.size() != static_cast<size_t>(grid.numPatches()))
            throw PipelineError(ErrorCode::InvalidGeometry,
                                "score count does not match the patch grid");

        cv::Mat mask(grid.hPatches, grid.wPatches, CV_8UC1);
        for (int i = 0; i < grid.numPatches(); ++i)
            mask.data[i] = scores[i] > threshold ? 255 : 0;

        cv::Mat labels, stats, centroids;
        const int count = cv::connectedComponentsWithStats(mask, labels, stats, centroids,
                                                           8, CV_32S);
        if (count <= 1)
            return false;   // background only

        // raster index of the first patch of each region, for tie-breaking
        std::vector<int> first_seen(count, -1);
        for (int i = 0; i < grid.numPatches(); ++i) {
            const int label = labels.at<int>(i / grid.wPatches, i % grid.wPatches);
            if (first_seen[label] < 0) first_seen[label] = i;
        }

        int best_label = 0;
        int best_area  = 0;
        for (int label = 1; label < count; ++label) {
            const int area = stats.at<int>(label, cv::CC_STAT_AREA);
            if (area > best_area
                || (area == best_area && first_seen[label] < first_seen[best_label])) {
                best_area  = area;
                best_label = label;
            }
        }

        for (int y = 0; y < grid.hPatches; ++y) {
            const int* row = labels.ptr<int>(y);
            for (int x = 0; x < grid.wPatches; ++x)
                if (row[x] != best_label)
                    scores[static_cast<size_t>(y) * grid.wPatches + x] = 0.0f;
        }
        return true;
    }

    void apply(std::vector<float>&         scores,
               const preprocess::PatchGrid& grid,
               float                        threshold,
               bool                         largestAreaOnly)
    {
        if (largestAreaOnly)
            keepLargestRegion(scores, grid, threshold);
    }
}
