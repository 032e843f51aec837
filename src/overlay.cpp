#include "overlay.hpp"
#include "errors.hpp"

cv::Mat overlay::render(const std::vector<float>&    scores,
                        const preprocess::PatchGrid& grid,
                        float                        threshold,
                        Rgba                         color)
{
    if (scores.size() != static_cast<size_t>(grid.numPatches()))
        throw PipelineError(ErrorCode::InvalidGeometry,
                            "score count does not match the patch grid");

    cv::Mat pixels(grid.hPatches, grid.wPatches, CV_8UC4, cv::Scalar::all(0));
    for (size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] <= threshold) continue;
        uint8_t* px = pixels.data + i * 4;
        px[0] = color.r;
        px[1] = color.g;
        px[2] = color.b;
        px[3] = color.a;
    }
    return pixels;
}

void overlay::blend(cv::Mat& bgrFrame, const cv::Mat& rgbaMask)
{
    if (bgrFrame.empty() || rgbaMask.empty()) return;

    cv::Mat scaled;
    cv::resize(rgbaMask, scaled, bgrFrame.size(), 0, 0, cv::INTER_NEAREST);

    for (int y = 0; y < bgrFrame.rows; ++y) {
        cv::Vec3b*       dst = bgrFrame.ptr<cv::Vec3b>(y);
        const cv::Vec4b* src = scaled.ptr<cv::Vec4b>(y);
        for (int x = 0; x < bgrFrame.cols; ++x) {
            const float alpha = src[x][3] / 255.0f;
            if (alpha == 0.0f) continue;
            // mask is RGBA, frame is BGR
            dst[x][0] = cv::saturate_cast<uchar>(src[x][2] * alpha + dst[x][0] * (1.0f - alpha));
            dst[x][1] = cv::saturate_cast<uchar>(src[x][1] * alpha + dst[x][1] * (1.0f - alpha));
            dst[x][2] = cv::saturate_cast<uchar>(src[x][0] * alpha + dst[x][2] * (1.0f - alpha));
        }
    }
}
