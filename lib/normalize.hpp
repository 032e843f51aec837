#pragma once
#include "frame.hpp"
#include <opencv2/opencv.hpp>

namespace normalize
{
    // Converts a camera frame into an upright, interleaved RGB image
    // (CV_8UC3). The sensor delivers frames rotated, so the result is
    // turned 90 degrees clockwise.
    //
    // • BGRA8888 : one packed plane, converted straight to RGB
    // • YUV420   : Y, U, V planes gathered into one I420 buffer first
    //
    // Throws PipelineError(UnsupportedFormat) for any other format and for
    // planes that do not cover the declared geometry. The input planes are
    // never written to.
    cv::Mat toUprightRgb(const RawFrame& frame);

    // Packs the three YUV420 planes into a contiguous I420 buffer of
    // width*height*3/2 bytes (Y, then U, then V).
    std::vector<uint8_t> packI420(const RawFrame& frame);
}
