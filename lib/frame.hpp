#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

enum class PixelFormat {
    Yuv420,     // three planes: Y, U, V (chroma at half resolution)
    Bgra8888,   // one packed plane, 4 bytes per pixel
    Unknown
};

// Non-owning view of one camera plane.
struct FramePlane {
    const uint8_t* data        = nullptr;
    size_t         size        = 0;   // bytes available at data
    int            rowStride   = 0;   // bytes per row, 0 = tightly packed
    int            pixelStride = 1;   // bytes between neighbouring samples
};

// A frame as delivered by the frame source. The planes belong to the
// source and are only valid for the duration of the call they are passed to.
struct RawFrame {
    int                     width  = 0;
    int                     height = 0;
    PixelFormat             format = PixelFormat::Unknown;
    std::vector<FramePlane> planes;
};

// Owning copy of a RawFrame, used to carry a frame across the worker boundary.
class OwnedFrame {
public:
    OwnedFrame() = default;
    explicit OwnedFrame(const RawFrame& frame);

    // View over the owned bytes; valid while this object lives.
    RawFrame view() const;

private:
    int                               width_  = 0;
    int                               height_ = 0;
    PixelFormat                       format_ = PixelFormat::Unknown;
    std::vector<std::vector<uint8_t>> bytes_;
    std::vector<FramePlane>           layout_;
};
