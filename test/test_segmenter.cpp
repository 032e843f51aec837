#include <gtest/gtest.h>
#include <vector>

#include "errors.hpp"
#include "fakes.hpp"
#include "overlay.hpp"
#include "segmenter.hpp"

namespace {

/* Returns one score fewer than there are patches. */
class ShortClassifier : public PatchClassifier {
    public:
        std::vector<float> classify(const tensor_utils::Embedding& e) override {
            return std::vector<float>(static_cast<size_t>(e.numPatches - 1), 1.0f);
        }
};

/* Two foreground blobs: a 2x2 block in the top-left corner and a single patch. */
class TwoBlobClassifier : public PatchClassifier {
    public:
        explicit TwoBlobClassifier(int wPatches) : w(wPatches) {}

        std::vector<float> classify(const tensor_utils::Embedding& e) override {
            std::vector<float> scores(static_cast<size_t>(e.numPatches), 0.1f);
            scores[0] = scores[1] = scores[w] = scores[w + 1] = 0.95f;
            scores[5 * w + 5] = 0.95f;
            return scores;
        }

    private:
        int w;
};

} // namespace

class SegmenterTests : public ::testing::Test {
    protected:
        void SetUp() override {
            bgra = cv::Mat(256, 256, CV_8UC4, cv::Scalar(40, 120, 200, 255));
        }
        void TearDown() override {}

        cv::Mat bgra;
        PipelineConfig config;
        fakes::PatchMeanExtractor features;
};

TEST_F(SegmenterTests, MissingEngineIsSessionNotReady) {
    fakes::ConstantClassifier classifier(0.9f);
    try {
        segmentFrame(fakes::bgraFrame(bgra), &features, nullptr, config);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        ASSERT_EQ(e.code(), ErrorCode::SessionNotReady);
    }
    ASSERT_THROW(segmentFrame(fakes::bgraFrame(bgra), nullptr, &classifier, config), PipelineError);
}

TEST_F(SegmenterTests, SquareFrameIsFullyHighlighted) {
    fakes::ConstantClassifier classifier(0.9f);
    SegmentationResult r = segmentFrame(fakes::bgraFrame(bgra), &features, &classifier, config);

    ASSERT_EQ(r.grid.hPatches, 20);
    ASSERT_EQ(r.grid.wPatches, 20);
    ASSERT_EQ(r.scores.size(), 400u);
    ASSERT_EQ(r.overlay.rows, 20);
    ASSERT_EQ(r.overlay.cols, 20);
    for (int y = 0; y < r.overlay.rows; ++y)
        for (int x = 0; x < r.overlay.cols; ++x)
            ASSERT_EQ(r.overlay.at<cv::Vec4b>(y, x)[3], overlay::kHighlight.a);
}

TEST_F(SegmenterTests, BelowThresholdIsTransparent) {
    fakes::ConstantClassifier classifier(0.6f);
    SegmentationResult r = segmentFrame(fakes::bgraFrame(bgra), &features, &classifier, config);
    ASSERT_EQ(cv::countNonZero(r.overlay.reshape(1)), 0);
}

TEST_F(SegmenterTests, SameFrameGivesSameResult) {
    cv::Mat frame(240, 320, CV_8UC4);
    cv::randu(frame, cv::Scalar::all(0), cv::Scalar::all(255));
    fakes::LinearClassifier classifier;

    SegmentationResult a = segmentFrame(fakes::bgraFrame(frame), &features, &classifier, config);
    SegmentationResult b = segmentFrame(fakes::bgraFrame(frame), &features, &classifier, config);
    ASSERT_EQ(a.scores, b.scores);
    ASSERT_EQ(cv::norm(a.overlay, b.overlay, cv::NORM_INF), 0.0);
}

TEST_F(SegmenterTests, ScoreCountMismatchIsInferenceError) {
    ShortClassifier classifier;
    try {
        segmentFrame(fakes::bgraFrame(bgra), &features, &classifier, config);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        ASSERT_EQ(e.code(), ErrorCode::InferenceError);
    }
}

TEST_F(SegmenterTests, LargestAreaFilterIsApplied) {
    TwoBlobClassifier classifier(20);
    config.largestAreaOnly = true;
    SegmentationResult r = segmentFrame(fakes::bgraFrame(bgra), &features, &classifier, config);

    ASSERT_FLOAT_EQ(r.scores[0], 0.95f);
    ASSERT_FLOAT_EQ(r.scores[21], 0.95f);
    ASSERT_FLOAT_EQ(r.scores[5 * 20 + 5], 0.0f);
    ASSERT_EQ(r.overlay.at<cv::Vec4b>(5, 5)[3], 0);
}

TEST_F(SegmenterTests, UnsupportedFrameIsReported) {
    fakes::ConstantClassifier classifier(0.9f);
    RawFrame frame = fakes::bgraFrame(bgra);
    frame.format = PixelFormat::Unknown;
    try {
        segmentFrame(frame, &features, &classifier, config);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        ASSERT_EQ(e.code(), ErrorCode::UnsupportedFormat);
    }
    ASSERT_EQ(features.calls.load(), 0);
}
