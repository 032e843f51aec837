#pragma once
#include "engines.hpp"
#include "onnx_model.hpp"
#include <memory>

// Creates ONNX Runtime backed engines that share one Ort::Env.
class OnnxEngineFactory : public EngineFactory {
public:
    OnnxEngineFactory(SessionSettings                 settings,
                      tensor_utils::ProbabilityLayout layout,
                      OrtLoggingLevel                 log_level = ORT_LOGGING_LEVEL_WARNING);

    std::unique_ptr<FeatureExtractor> loadFeatureExtractor(const std::string& path) override;
    std::unique_ptr<PatchClassifier>  loadClassifier(const std::string& path)       override;

private:
    std::shared_ptr<Ort::Env>       env_;
    SessionSettings                 settings_;
    tensor_utils::ProbabilityLayout layout_;
};
