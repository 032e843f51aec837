#pragma once
#include "engines.hpp"
#include "onnx_model.hpp"
#include <memory>

class FeatureEngine : public FeatureExtractor {
public:
    // Throws PipelineError(ModelLoadError).
    FeatureEngine(std::shared_ptr<Ort::Env> env,
                  const std::string&        model_path,
                  const SessionSettings&    settings);

    tensor_utils::Embedding extract(const preprocess::InputTensor& input,
                                    int64_t numPatches) override;

private:
    std::shared_ptr<Ort::Env>  env_;     // must outlive model_
    std::unique_ptr<OnnxModel> model_;
    std::string                inputName_;
    std::string                outputName_;
};
