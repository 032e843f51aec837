#include "camera.hpp"
#include "log.hpp"
#include <stdexcept>

Camera::Camera(int index, int w, int h) : cap_(index)
{
    if (!cap_.isOpened())
        throw std::runtime_error("Could not open camera " + std::to_string(index));

    cap_.set(cv::CAP_PROP_FRAME_WIDTH,  w);
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, h);
    PATCHSEG_LOG_INFO("Camera") << "Camera resolution: "
                                << cap_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
                                << cap_.get(cv::CAP_PROP_FRAME_HEIGHT);
}

bool Camera::grabFrame(cv::Mat& bgra)
{
    cap_ >> bgr_;
    if (bgr_.empty()) return false;

    cv::Mat sideways;
    cv::rotate(bgr_, sideways, cv::ROTATE_90_COUNTERCLOCKWISE);
    cv::cvtColor(sideways, bgra, cv::COLOR_BGR2BGRA);
    return true;
}

RawFrame Camera::view(const cv::Mat& bgra)
{
    RawFrame frame;
    frame.width  = bgra.cols;
    frame.height = bgra.rows;
    frame.format = PixelFormat::Bgra8888;

    FramePlane plane;
    plane.data      = bgra.data;
    plane.rowStride = static_cast<int>(bgra.step[0]);
    plane.size      = bgra.step[0] * bgra.rows;
    frame.planes.push_back(plane);
    return frame;
}
