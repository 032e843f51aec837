#pragma once
#include <onnxruntime_cxx_api.h>
#include <cstdint>
#include <string>
#include <vector>

namespace infer
{
    // Borrowed view of a float output tensor; valid while the Ort::Value lives.
    struct FloatOutput {
        const float* data  = nullptr;
        size_t       count = 0;
    };

    // Wraps `values` (not copied) as a float tensor of `shape`, runs one
    // forward pass and returns the requested outputs in order.
    // Throws PipelineError(InferenceError) on any runtime error.
    std::vector<Ort::Value> run(Ort::Session&                   session,
                                const std::string&              input_name,
                                const std::vector<float>&       values,
                                const std::vector<int64_t>&     shape,
                                const std::vector<std::string>& output_names);

    // Throws PipelineError(InferenceError) unless `value` is a float tensor.
    FloatOutput floatTensor(const Ort::Value& value, const std::string& what);
}
