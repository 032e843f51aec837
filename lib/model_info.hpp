#pragma once
#include <onnxruntime_cxx_api.h>
#include <cstdint>
#include <string>
#include <vector>

namespace modelutil
{
    /* ----------  small helper types ---------- */

    struct NodeInfo {
        std::string          name;
        bool                 isTensor = false;
        std::vector<int64_t> shape;     // empty when not a tensor; -1 marks a dynamic dim
    };

    struct ModelIo {
        std::vector<NodeInfo> inputs;
        std::vector<NodeInfo> outputs;
    };

    /* ----------  API ---------- */

    // Walks every input and output node, logs name and shape under `tag`,
    // and returns what it found. Throws Ort::Exception if the session
    // cannot be queried.
    ModelIo inspect(Ort::Session&                     session,
                    Ort::AllocatorWithDefaultOptions& alloc,
                    const char*                       tag);
}
