#pragma once
#include "errors.hpp"
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <vector>

namespace tensor_utils {

// Patch embeddings produced by the feature model, row-major
// [numPatches, featureDim].
struct Embedding {
    std::vector<float> values;
    int64_t numPatches = 0;
    int64_t featureDim = 0;
};

// How the classifier lays out its per-patch probabilities: classCount
// values per patch, the foreground probability at foregroundIndex.
// The default matches a binary scikit-learn export with ZipMap disabled
// ([bg, fg, bg, fg, ...]).
struct ProbabilityLayout {
    int classCount      = 2;
    int foregroundIndex = 1;
};

// featureDim is never fixed; it is whatever the feature model produced per
// patch. Throws PipelineError(InvalidGeometry) if the element count does not
// divide evenly.
inline int64_t featureDim(size_t totalElements, int64_t numPatches)
{
    if (numPatches <= 0 || totalElements == 0
        || totalElements % static_cast<size_t>(numPatches) != 0) {
        std::ostringstream msg;
        msg << "feature tensor of " << totalElements
            << " elements does not split into " << numPatches << " patches";
        throw PipelineError(ErrorCode::InvalidGeometry, msg.str());
    }
    return static_cast<int64_t>(totalElements / static_cast<size_t>(numPatches));
}

inline Embedding makeEmbedding(const float* data, size_t totalElements, int64_t numPatches)
{
    Embedding e;
    e.numPatches = numPatches;
    e.featureDim = featureDim(totalElements, numPatches);
    e.values.assign(data, data + totalElements);
    return e;
}

class ProbabilityView {
public:
    // Validates that a flat probability buffer holds exactly
    // numPatches * layout.classCount values.
    ProbabilityView(const float* data, size_t count, int64_t numPatches,
                    ProbabilityLayout layout)
        : data_(data), numPatches_(numPatches), layout_(layout)
    {
        if (layout_.classCount < 1 || layout_.foregroundIndex < 0
            || layout_.foregroundIndex >= layout_.classCount)
            throw PipelineError(ErrorCode::InferenceError,
                                "foreground index outside the class count");

        const size_t expected = static_cast<size_t>(numPatches_) * layout_.classCount;
        if (count != expected) {
            std::ostringstream msg;
            msg << "probability output has " << count << " values, expected "
                << expected << " (" << numPatches_ << " patches x "
                << layout_.classCount << " classes)";
            throw PipelineError(ErrorCode::InferenceError, msg.str());
        }
    }

    float foreground(int64_t patch) const
    {
        return data_[patch * layout_.classCount + layout_.foregroundIndex];
    }

    std::vector<float> foregroundScores() const
    {
        std::vector<float> scores(static_cast<size_t>(numPatches_));
        for (int64_t i = 0; i < numPatches_; ++i)
            scores[static_cast<size_t>(i)] = foreground(i);
        return scores;
    }

private:
    const float*      data_;
    int64_t           numPatches_;
    ProbabilityLayout layout_;
};

} // namespace tensor_utils
