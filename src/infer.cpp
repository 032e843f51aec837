#include "infer.hpp"
#include "errors.hpp"

namespace infer
{
    std::vector<Ort::Value> run(Ort::Session&                   session,
                                const std::string&              input_name,
                                const std::vector<float>&       values,
                                const std::vector<int64_t>&     shape,
                                const std::vector<std::string>& output_names)
    {
        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<const char*> out_names_c;
        out_names_c.reserve(output_names.size());
        for (const auto& s : output_names) out_names_c.push_back(s.c_str());
        const char* in_name_c = input_name.c_str();

        try {
            // ORT takes a mutable pointer but only reads input buffers
            Ort::Value input = Ort::Value::CreateTensor<float>(memory_info,
                                                               const_cast<float*>(values.data()),
                                                               values.size(),
                                                               shape.data(), shape.size());
            return session.Run(Ort::RunOptions{nullptr},
                               &in_name_c, &input, 1,
                               out_names_c.data(), out_names_c.size());
        } catch (const Ort::Exception& e) {
            throw PipelineError(ErrorCode::InferenceError, e.what());
        }
    }

    FloatOutput floatTensor(const Ort::Value& value, const std::string& what)
    {
        if (!value.IsTensor())
            throw PipelineError(ErrorCode::InferenceError, what + " is not a tensor");

        auto info = value.GetTensorTypeAndShapeInfo();
        if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT)
            throw PipelineError(ErrorCode::InferenceError, what + " is not float");

        return {value.GetTensorData<float>(), info.GetElementCount()};
    }
}
