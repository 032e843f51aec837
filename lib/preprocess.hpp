#pragma once
#include <opencv2/opencv.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace preprocess
{
    constexpr int kPatchStride = 16;

    constexpr std::array<float, 3> kMean = {0.485f, 0.456f, 0.406f};
    constexpr std::array<float, 3> kStd  = {0.229f, 0.224f, 0.225f};

    struct PatchGrid {
        int hPatches = 0;
        int wPatches = 0;

        int numPatches() const { return hPatches * wPatches; }
        int height()     const { return hPatches * kPatchStride; }
        int width()      const { return wPatches * kPatchStride; }
    };

    // Input tensor for the feature model, NCHW, batch of one.
    struct InputTensor {
        std::vector<float>     values;
        std::array<int64_t, 4> shape{};   // {1, 3, H, W}
    };

    struct EncodedFrame {
        InputTensor tensor;
        PatchGrid   grid;
    };

    // Patch grid for an upright image of cols x rows scaled so that its
    // height is inputSize. wPatches is rounded, then forced even.
    // Throws PipelineError(InvalidGeometry) when either side ends up empty.
    PatchGrid patchGrid(int cols, int rows, int inputSize);

    // Resize an RGB frame (CV_8UC3) to its patch grid and convert it to a
    // normalized float tensor.
    // • rgb       : upright RGB image from the frame normalizer
    // • inputSize : target height in pixels (320, 400, 512, 768)
    EncodedFrame toTensor(const cv::Mat& rgb, int inputSize);

    // Channel-first ImageNet normalization of an already patch-aligned RGB
    // image. Throws PipelineError(InvalidGeometry) if the image is not a
    // multiple of kPatchStride on both sides.
    InputTensor normalizeToTensor(const cv::Mat& rgb);
}
