#include "classifier_engine.hpp"
#include "errors.hpp"
#include "infer.hpp"
#include "shape_string.hpp"

namespace
{
    const char* const kTag = "ClassifierEngine";

    std::unique_ptr<OnnxModel> openClassifierModel(Ort::Env&              env,
                                                   const std::string&     path,
                                                   const SessionSettings& settings)
    {
        std::unique_ptr<OnnxModel> model;
        try {
            model = std::make_unique<OnnxModel>(env, path, settings, kTag);
        } catch (const Ort::Exception& e) {
            throw PipelineError(ErrorCode::ModelLoadError,
                                "classifier " + path + ": " + e.what());
        }

        const modelutil::ModelIo& io = model->io();
        if (io.inputs.size() != 1)
            throw PipelineError(ErrorCode::ModelLoadError,
                                "classifier must have exactly one input, has "
                                + std::to_string(io.inputs.size()));
        if (!io.inputs[0].isTensor
            || (!io.inputs[0].shape.empty() && io.inputs[0].shape.size() != 2))
            throw PipelineError(ErrorCode::ModelLoadError,
                                "classifier input must be [numPatches, featureDim], got "
                                + util::shapeString(io.inputs[0].shape));
        if (io.outputs.size() < 2)
            throw PipelineError(ErrorCode::ModelLoadError,
                                "classifier needs label and probability outputs, has "
                                + std::to_string(io.outputs.size()));
        return model;
    }
}

ClassifierEngine::ClassifierEngine(std::shared_ptr<Ort::Env>       env,
                                   const std::string&              model_path,
                                   const SessionSettings&          settings,
                                   tensor_utils::ProbabilityLayout layout)
    : env_(std::move(env)),
      model_(openClassifierModel(*env_, model_path, settings)),
      layout_(layout),
      inputName_(model_->io().inputs[0].name),
      labelName_(model_->io().outputs[0].name),
      probabilityName_(model_->io().outputs[1].name)
{
}

std::vector<float> ClassifierEngine::classify(const tensor_utils::Embedding& embedding)
{
    std::vector<Ort::Value> outputs = infer::run(model_->session(), inputName_, embedding.values,
                                                 {embedding.numPatches, embedding.featureDim},
                                                 {labelName_, probabilityName_});
    if (outputs.size() != 2)
        throw PipelineError(ErrorCode::InferenceError, "classifier returned "
                            + std::to_string(outputs.size()) + " outputs, expected 2");

    const Ort::Value& labels = outputs[0];
    if (!labels.IsTensor()
        || labels.GetTensorTypeAndShapeInfo().GetElementCount()
               != static_cast<size_t>(embedding.numPatches))
        throw PipelineError(ErrorCode::InferenceError,
                            "label output does not hold one label per patch");

    // a ZipMap export yields a sequence of maps here
    if (!outputs[1].IsTensor())
        throw PipelineError(ErrorCode::InferenceError,
                            "probability output is not a tensor (export with zipmap disabled)");

    const infer::FloatOutput probs = infer::floatTensor(outputs[1], "probability output");
    tensor_utils::ProbabilityView view(probs.data, probs.count, embedding.numPatches, layout_);
    return view.foregroundScores();
}
