#include "model_info.hpp"
#include "log.hpp"
#include "shape_string.hpp"

namespace modelutil
{
    /* ---------- helpers ---------- */

    static NodeInfo describe(Ort::TypeInfo type_info, std::string name)
    {
        NodeInfo node;
        node.name     = std::move(name);
        node.isTensor = type_info.GetONNXType() == ONNX_TYPE_TENSOR;
        if (node.isTensor)
            node.shape = type_info.GetTensorTypeAndShapeInfo().GetShape();
        return node;
    }

    static std::string shapeOf(const NodeInfo& node)
    {
        return node.isTensor ? util::shapeString(node.shape) : std::string("<non-tensor>");
    }

    /* ---------- public API ---------- */

    ModelIo inspect(Ort::Session&                     session,
                    Ort::AllocatorWithDefaultOptions& alloc,
                    const char*                       tag)
    {
        ModelIo io;

        const size_t n_inputs = session.GetInputCount();
        for (size_t i = 0; i < n_inputs; ++i)
        {
            Ort::AllocatedStringPtr name_alloc = session.GetInputNameAllocated(i, alloc);
            io.inputs.push_back(describe(session.GetInputTypeInfo(i), name_alloc.get()));
            PATCHSEG_LOG_INFO(tag) << "Input " << i << " Name: " << io.inputs.back().name
                                   << " Dims: " << shapeOf(io.inputs.back());
        }

        const size_t n_outputs = session.GetOutputCount();
        for (size_t i = 0; i < n_outputs; ++i)
        {
            Ort::AllocatedStringPtr name_alloc = session.GetOutputNameAllocated(i, alloc);
            io.outputs.push_back(describe(session.GetOutputTypeInfo(i), name_alloc.get()));
            PATCHSEG_LOG_INFO(tag) << "Output " << i << " Name: " << io.outputs.back().name
                                   << " Dims: " << shapeOf(io.outputs.back());
        }
        return io;
    }
}
