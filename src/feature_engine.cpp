#include "feature_engine.hpp"
#include "errors.hpp"
#include "infer.hpp"
#include "shape_string.hpp"

namespace
{
    const char* const kTag = "FeatureEngine";

    std::unique_ptr<OnnxModel> openFeatureModel(Ort::Env&              env,
                                                const std::string&     path,
                                                const SessionSettings& settings)
    {
        std::unique_ptr<OnnxModel> model;
        try {
            model = std::make_unique<OnnxModel>(env, path, settings, kTag);
        } catch (const Ort::Exception& e) {
            throw PipelineError(ErrorCode::ModelLoadError,
                                "feature model " + path + ": " + e.what());
        }

        const modelutil::ModelIo& io = model->io();
        if (io.inputs.size() != 1)
            throw PipelineError(ErrorCode::ModelLoadError,
                                "feature model must have exactly one input, has "
                                + std::to_string(io.inputs.size()));
        if (!io.inputs[0].isTensor
            || (!io.inputs[0].shape.empty() && io.inputs[0].shape.size() != 4))
            throw PipelineError(ErrorCode::ModelLoadError,
                                "feature model input must be an NCHW tensor, got "
                                + util::shapeString(io.inputs[0].shape));
        if (io.outputs.empty())
            throw PipelineError(ErrorCode::ModelLoadError, "feature model has no outputs");
        return model;
    }
}

FeatureEngine::FeatureEngine(std::shared_ptr<Ort::Env> env,
                             const std::string&        model_path,
                             const SessionSettings&    settings)
    : env_(std::move(env)),
      model_(openFeatureModel(*env_, model_path, settings)),
      inputName_(model_->io().inputs[0].name),
      outputName_(model_->io().outputs[0].name)
{
}

tensor_utils::Embedding FeatureEngine::extract(const preprocess::InputTensor& input,
                                               int64_t numPatches)
{
    const std::vector<int64_t> shape(input.shape.begin(), input.shape.end());
    std::vector<Ort::Value> outputs = infer::run(model_->session(), inputName_, input.values,
                                                 shape, {outputName_});
    if (outputs.empty())
        throw PipelineError(ErrorCode::InferenceError, "feature model returned no output");

    const infer::FloatOutput features = infer::floatTensor(outputs[0], "feature output");
    return tensor_utils::makeEmbedding(features.data, features.count, numPatches);
}
