#include "segmenter.hpp"
#include "errors.hpp"
#include "normalize.hpp"
#include "overlay.hpp"
#include "postprocess.hpp"

SegmentationResult segmentFrame(const RawFrame&       frame,
                                FeatureExtractor*     features,
                                PatchClassifier*      classifier,
                                const PipelineConfig& config)
{
    if (features == nullptr)
        throw PipelineError(ErrorCode::SessionNotReady, "feature model is not loaded");
    if (classifier == nullptr)
        throw PipelineError(ErrorCode::SessionNotReady, "no classifier is loaded");

    // 1. Pre-processing
    const cv::Mat rgb = normalize::toUprightRgb(frame);
    preprocess::EncodedFrame encoded = preprocess::toTensor(rgb, config.inputSize);
    const preprocess::PatchGrid grid = encoded.grid;

    // 2. Feature extraction
    const tensor_utils::Embedding embedding = features->extract(encoded.tensor, grid.numPatches());

    // 3. Classification
    SegmentationResult result;
    result.grid   = grid;
    result.scores = classifier->classify(embedding);
    if (result.scores.size() != static_cast<size_t>(grid.numPatches()))
        throw PipelineError(ErrorCode::InferenceError,
                            "classifier returned " + std::to_string(result.scores.size())
                            + " scores for " + std::to_string(grid.numPatches()) + " patches");

    // 4. Post-processing
    postprocess::apply(result.scores, grid, config.similarityThreshold, config.largestAreaOnly);
    result.overlay = overlay::render(result.scores, grid, config.similarityThreshold);
    return result;
}
