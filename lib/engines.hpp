#pragma once
#include "preprocess.hpp"
#include "tensor_utils.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Heavy model turning an image tensor into per-patch embeddings.
// Loaded once and shared read-only between cycles.
class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;

    // Throws PipelineError(InferenceError) if the model fails and
    // PipelineError(InvalidGeometry) if its output does not split into
    // numPatches rows.
    virtual tensor_utils::Embedding extract(const preprocess::InputTensor& input,
                                            int64_t numPatches) = 0;
};

// Small, replaceable model scoring each patch embedding.
class PatchClassifier {
public:
    virtual ~PatchClassifier() = default;

    // One foreground probability per patch.
    // Throws PipelineError(InferenceError).
    virtual std::vector<float> classify(const tensor_utils::Embedding& embedding) = 0;
};

// Builds engines from model files. Both calls throw
// PipelineError(ModelLoadError) when the file cannot be loaded or does not
// have the expected inputs and outputs.
class EngineFactory {
public:
    virtual ~EngineFactory() = default;

    virtual std::unique_ptr<FeatureExtractor> loadFeatureExtractor(const std::string& path) = 0;
    virtual std::unique_ptr<PatchClassifier>  loadClassifier(const std::string& path)       = 0;
};
