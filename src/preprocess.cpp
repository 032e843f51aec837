#include "preprocess.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

namespace preprocess
{
    PatchGrid patchGrid(int cols, int rows, int inputSize)
    {
        if (cols <= 0 || rows <= 0 || inputSize <= 0)
            throw PipelineError(ErrorCode::InvalidGeometry, "empty frame or input size");

        PatchGrid grid;
        grid.hPatches = inputSize / kPatchStride;
        grid.wPatches = static_cast<int>(std::lround(
            static_cast<double>(cols) * inputSize / (static_cast<double>(rows) * kPatchStride)));
        if (grid.wPatches % 2 != 0)
            grid.wPatches -= 1;

        if (grid.hPatches <= 0 || grid.wPatches <= 0) {
            std::ostringstream msg;
            msg << "patch grid " << grid.hPatches << 'x' << grid.wPatches
                << " for a " << cols << 'x' << rows << " frame at input size " << inputSize;
            throw PipelineError(ErrorCode::InvalidGeometry, msg.str());
        }
        return grid;
    }

    InputTensor normalizeToTensor(const cv::Mat& rgb)
    {
        const int height = rgb.rows;
        const int width  = rgb.cols;
        if (height <= 0 || width <= 0
            || height % kPatchStride != 0 || width % kPatchStride != 0) {
            std::ostringstream msg;
            msg << "image " << width << 'x' << height
                << " is not a multiple of the patch stride " << kPatchStride;
            throw PipelineError(ErrorCode::InvalidGeometry, msg.str());
        }
        if (rgb.type() != CV_8UC3)
            throw PipelineError(ErrorCode::InvalidGeometry, "expected an 8-bit RGB image");

        cv::Mat f32;
        rgb.convertTo(f32, CV_32F, 1.0 / 255.0);   // scale to 0-1

        InputTensor tensor;
        tensor.shape = {1, 3, height, width};
        tensor.values.resize(static_cast<size_t>(3) * height * width);

        const size_t plane = static_cast<size_t>(height) * width;
        for (int c = 0; c < 3; ++c) {
            float* out = tensor.values.data() + c * plane;
            for (int h = 0; h < height; ++h) {
                const cv::Vec3f* row = f32.ptr<cv::Vec3f>(h);
                for (int w = 0; w < width; ++w)
                    out[static_cast<size_t>(h) * width + w] = (row[w][c] - kMean[c]) / kStd[c];
            }
        }
        return tensor;
    }

    EncodedFrame toTensor(const cv::Mat& rgb, int inputSize)
    {
        EncodedFrame out;
        out.grid = patchGrid(rgb.cols, rgb.rows, inputSize);

        cv::Mat resized;
        cv::resize(rgb, resized, cv::Size(out.grid.width(), out.grid.height()),
                   0, 0, cv::INTER_CUBIC);

        out.tensor = normalizeToTensor(resized);
        return out;
    }
}
