#include "onnx_model.hpp"
#include "log.hpp"

OnnxModel::OnnxModel(Ort::Env&              env,
                     const std::string&     model_path,
                     const SessionSettings& settings,
                     const char*            tag)
    : opts_(),
      session_(nullptr)
{
    opts_.SetIntraOpNumThreads(settings.intraOpThreads);

    if (settings.useCuda) {
        OrtCUDAProviderOptions cuda_opts{};
        try {
            opts_.AppendExecutionProvider_CUDA(cuda_opts);
            PATCHSEG_LOG_INFO(tag) << "Attempting to use CUDA execution provider.";
        } catch (const Ort::Exception& e) {
            PATCHSEG_LOG_WARN(tag) << "Could not append CUDA execution provider: " << e.what()
                                   << "; falling back to CPU.";
        }
    }

    session_ = Ort::Session(env, model_path.c_str(), opts_);
    PATCHSEG_LOG_INFO(tag) << "ONNX model loaded successfully: " << model_path;

    io_ = modelutil::inspect(session_, allocator_, tag);
}
