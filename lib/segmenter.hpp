#pragma once
#include "config.hpp"
#include "engines.hpp"
#include "frame.hpp"
#include "preprocess.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

struct SegmentationResult {
    std::vector<float>    scores;    // one foreground probability per patch
    preprocess::PatchGrid grid;
    cv::Mat               overlay;   // RGBA, one pixel per patch
};

// Runs one full cycle on the calling thread:
// normalize -> encode -> extract -> classify -> post-process -> render.
// Every intermediate buffer is owned by this call and released on return,
// including when a stage throws.
//
// Throws PipelineError: SessionNotReady if an engine is missing, otherwise
// whatever the failing stage reports.
SegmentationResult segmentFrame(const RawFrame&       frame,
                                FeatureExtractor*     features,
                                PatchClassifier*      classifier,
                                const PipelineConfig& config);
