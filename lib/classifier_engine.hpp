#pragma once
#include "engines.hpp"
#include "onnx_model.hpp"
#include <memory>

class ClassifierEngine : public PatchClassifier {
public:
    // Throws PipelineError(ModelLoadError).
    ClassifierEngine(std::shared_ptr<Ort::Env>       env,
                     const std::string&              model_path,
                     const SessionSettings&          settings,
                     tensor_utils::ProbabilityLayout layout = {});

    std::vector<float> classify(const tensor_utils::Embedding& embedding) override;

private:
    std::shared_ptr<Ort::Env>       env_;
    std::unique_ptr<OnnxModel>      model_;
    tensor_utils::ProbabilityLayout layout_;
    std::string                     inputName_;
    std::string                     labelName_;
    std::string                     probabilityName_;
};
