#pragma once
#include "frame.hpp"
#include <opencv2/opencv.hpp>

// Desktop stand-in for a phone camera: frames come out as packed BGRA,
// rotated 90 degrees counter-clockwise like a sensor mounted sideways.
class Camera {
public:
    // throws std::runtime_error if the device cannot be opened
    Camera(int index = 0, int w = 640, int h = 480);
    bool grabFrame(cv::Mat& bgra);

    // RawFrame view over a BGRA image; valid while `bgra` lives.
    static RawFrame view(const cv::Mat& bgra);

private:
    cv::VideoCapture cap_;
    cv::Mat          bgr_;
};
