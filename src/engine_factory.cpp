#include "engine_factory.hpp"
#include "classifier_engine.hpp"
#include "feature_engine.hpp"
#include "errors.hpp"
#include <filesystem>

namespace
{
    void requireFile(const std::string& path, const char* what)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            throw PipelineError(ErrorCode::ModelLoadError,
                                std::string(what) + " not found: " + path);
    }
}

OnnxEngineFactory::OnnxEngineFactory(SessionSettings                 settings,
                                     tensor_utils::ProbabilityLayout layout,
                                     OrtLoggingLevel                 log_level)
    : env_(std::make_shared<Ort::Env>(log_level, "patchseg")),
      settings_(settings),
      layout_(layout)
{
}

std::unique_ptr<FeatureExtractor> OnnxEngineFactory::loadFeatureExtractor(const std::string& path)
{
    requireFile(path, "feature model");
    return std::make_unique<FeatureEngine>(env_, path, settings_);
}

std::unique_ptr<PatchClassifier> OnnxEngineFactory::loadClassifier(const std::string& path)
{
    requireFile(path, "classifier");
    return std::make_unique<ClassifierEngine>(env_, path, settings_, layout_);
}
