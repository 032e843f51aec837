#include <gtest/gtest.h>
#include <cmath>

#include "config.hpp"
#include "errors.hpp"
#include "preprocess.hpp"

class TensorEncoderTests : public ::testing::Test {
    protected:
        void SetUp() override {}
        void TearDown() override {}
};

TEST_F(TensorEncoderTests, GridHeightMatchesEverySupportedSize) {
    for (int size : kSupportedInputSizes) {
        preprocess::PatchGrid grid = preprocess::patchGrid(480, 640, size);
        ASSERT_EQ(grid.height(), size);
        ASSERT_EQ(grid.hPatches, size / preprocess::kPatchStride);
        ASSERT_EQ(grid.wPatches % 2, 0) << "size " << size;
        ASSERT_GT(grid.wPatches, 0);
    }
}

TEST_F(TensorEncoderTests, PatchWidthIsAlwaysEven) {
    const int widths[] = {100, 333, 480, 641, 720, 1080, 1920};
    for (int size : kSupportedInputSizes)
        for (int cols : widths) {
            preprocess::PatchGrid grid = preprocess::patchGrid(cols, 720, size);
            ASSERT_EQ(grid.wPatches % 2, 0) << cols << " @ " << size;
        }
}

TEST_F(TensorEncoderTests, PortraitFrameAt320) {
    // 480 * 320 / (640 * 16) = 15, made even
    preprocess::PatchGrid grid = preprocess::patchGrid(480, 640, 320);
    ASSERT_EQ(grid.hPatches, 20);
    ASSERT_EQ(grid.wPatches, 14);
    ASSERT_EQ(grid.numPatches(), 280);
}

TEST_F(TensorEncoderTests, DegenerateGeometryIsRejected) {
    ASSERT_THROW(preprocess::patchGrid(1, 1000, 320), PipelineError);
    ASSERT_THROW(preprocess::patchGrid(0, 480, 320), PipelineError);
    try {
        preprocess::patchGrid(640, 0, 320);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        ASSERT_EQ(e.code(), ErrorCode::InvalidGeometry);
    }
}

TEST_F(TensorEncoderTests, TensorShapeFollowsGrid) {
    cv::Mat rgb(100, 60, CV_8UC3, cv::Scalar(1, 2, 3));
    preprocess::EncodedFrame encoded = preprocess::toTensor(rgb, 320);

    ASSERT_EQ(encoded.tensor.shape[0], 1);
    ASSERT_EQ(encoded.tensor.shape[1], 3);
    ASSERT_EQ(encoded.tensor.shape[2], encoded.grid.height());
    ASSERT_EQ(encoded.tensor.shape[3], encoded.grid.width());
    ASSERT_EQ(encoded.tensor.values.size(),
              static_cast<size_t>(3 * encoded.grid.height() * encoded.grid.width()));
}

TEST_F(TensorEncoderTests, ValuesAreImageNetNormalized) {
    cv::Mat rgb(16, 32, CV_8UC3, cv::Scalar(255, 0, 128));
    preprocess::InputTensor t = preprocess::normalizeToTensor(rgb);

    const size_t plane = 16 * 32;
    ASSERT_EQ(t.values.size(), 3 * plane);
    ASSERT_NEAR(t.values[0],             (1.0f - 0.485f) / 0.229f, 1e-4);
    ASSERT_NEAR(t.values[plane],         (0.0f - 0.456f) / 0.224f, 1e-4);
    ASSERT_NEAR(t.values[2 * plane + 7], (128.0f / 255.0f - 0.406f) / 0.225f, 1e-4);
}

TEST_F(TensorEncoderTests, LayoutIsChannelMajor) {
    cv::Mat rgb(16, 32, CV_8UC3, cv::Scalar::all(0));
    rgb.at<cv::Vec3b>(1, 2) = cv::Vec3b(0, 255, 0);
    preprocess::InputTensor t = preprocess::normalizeToTensor(rgb);

    const size_t W = 32, plane = 16 * 32;
    const float on  = (1.0f - 0.456f) / 0.224f;
    const float off = (0.0f - 0.456f) / 0.224f;
    ASSERT_NEAR(t.values[plane + 1 * W + 2], on, 1e-4);
    ASSERT_NEAR(t.values[plane + 2 * W + 1], off, 1e-4);
    ASSERT_NEAR(t.values[1 * W + 2], (0.0f - 0.485f) / 0.229f, 1e-4);
}

TEST_F(TensorEncoderTests, UnalignedImageIsRejected) {
    cv::Mat rgb(30, 32, CV_8UC3, cv::Scalar::all(0));
    ASSERT_THROW(preprocess::normalizeToTensor(rgb), PipelineError);
}
