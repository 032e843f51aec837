#include "normalize.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

namespace normalize
{
    /* ---------- helpers ---------- */

    static void gatherPlane(const FramePlane& plane,
                            int cols, int rows,
                            uint8_t* out,
                            const char* which)
    {
        const int pixel_stride = plane.pixelStride > 0 ? plane.pixelStride : 1;
        const int row_stride   = plane.rowStride > 0 ? plane.rowStride : cols * pixel_stride;

        // last sample of the last row must be inside the plane
        const size_t needed = static_cast<size_t>(row_stride) * (rows - 1)
                            + static_cast<size_t>(pixel_stride) * (cols - 1) + 1;
        if (plane.data == nullptr || plane.size < needed) {
            std::ostringstream msg;
            msg << which << " plane holds " << plane.size << " bytes, needs " << needed;
            throw PipelineError(ErrorCode::UnsupportedFormat, msg.str());
        }

        for (int y = 0; y < rows; ++y) {
            const uint8_t* src = plane.data + static_cast<size_t>(y) * row_stride;
            uint8_t*       dst = out + static_cast<size_t>(y) * cols;
            if (pixel_stride == 1) {
                std::copy(src, src + cols, dst);
            } else {
                for (int x = 0; x < cols; ++x)
                    dst[x] = src[static_cast<size_t>(x) * pixel_stride];
            }
        }
    }

    static cv::Mat bgraToRgb(const RawFrame& frame)
    {
        if (frame.planes.size() != 1)
            throw PipelineError(ErrorCode::UnsupportedFormat,
                                "BGRA frame must have exactly one plane");

        const FramePlane& plane = frame.planes[0];
        const size_t row_bytes  = static_cast<size_t>(frame.width) * 4;
        const size_t stride     = plane.rowStride > 0 ? static_cast<size_t>(plane.rowStride) : row_bytes;
        if (stride < row_bytes || plane.data == nullptr
            || plane.size < stride * (frame.height - 1) + row_bytes)
            throw PipelineError(ErrorCode::UnsupportedFormat,
                                "BGRA plane is smaller than width*height*4");

        // wraps the source bytes; cvtColor writes into a fresh buffer
        const cv::Mat bgra(frame.height, frame.width, CV_8UC4,
                           const_cast<uint8_t*>(plane.data), stride);
        cv::Mat rgb;
        cv::cvtColor(bgra, rgb, cv::COLOR_BGRA2RGB);
        return rgb;
    }

    /* ---------- public API ---------- */

    std::vector<uint8_t> packI420(const RawFrame& frame)
    {
        if (frame.planes.size() != 3)
            throw PipelineError(ErrorCode::UnsupportedFormat,
                                "YUV420 frame must have three planes");
        if (frame.width % 2 != 0 || frame.height % 2 != 0)
            throw PipelineError(ErrorCode::UnsupportedFormat,
                                "YUV420 frame needs even width and height");

        const int    w        = frame.width;
        const int    h        = frame.height;
        const size_t y_size   = static_cast<size_t>(w) * h;
        const size_t uv_size  = y_size / 4;

        std::vector<uint8_t> yuv(y_size * 3 / 2);
        gatherPlane(frame.planes[0], w,     h,     yuv.data(),                     "Y");
        gatherPlane(frame.planes[1], w / 2, h / 2, yuv.data() + y_size,            "U");
        gatherPlane(frame.planes[2], w / 2, h / 2, yuv.data() + y_size + uv_size,  "V");
        return yuv;
    }

    cv::Mat toUprightRgb(const RawFrame& frame)
    {
        if (frame.width <= 0 || frame.height <= 0)
            throw PipelineError(ErrorCode::UnsupportedFormat, "frame has no pixels");

        cv::Mat rgb;
        switch (frame.format) {
            case PixelFormat::Bgra8888:
                rgb = bgraToRgb(frame);
                break;
            case PixelFormat::Yuv420: {
                std::vector<uint8_t> yuv = packI420(frame);
                const cv::Mat i420(frame.height * 3 / 2, frame.width, CV_8UC1, yuv.data());
                cv::cvtColor(i420, rgb, cv::COLOR_YUV2RGB_I420);
                break;
            }
            default:
                throw PipelineError(ErrorCode::UnsupportedFormat, "unknown pixel format");
        }

        cv::Mat upright;
        cv::rotate(rgb, upright, cv::ROTATE_90_CLOCKWISE);
        return upright;
    }
}
