#include "frame.hpp"

OwnedFrame::OwnedFrame(const RawFrame& frame)
    : width_(frame.width), height_(frame.height), format_(frame.format)
{
    bytes_.reserve(frame.planes.size());
    layout_.reserve(frame.planes.size());
    for (const FramePlane& p : frame.planes) {
        if (p.data != nullptr && p.size > 0)
            bytes_.emplace_back(p.data, p.data + p.size);
        else
            bytes_.emplace_back();
        layout_.push_back(p);
    }
}

RawFrame OwnedFrame::view() const
{
    RawFrame f;
    f.width  = width_;
    f.height = height_;
    f.format = format_;
    f.planes = layout_;
    for (size_t i = 0; i < f.planes.size(); ++i) {
        f.planes[i].data = bytes_[i].empty() ? nullptr : bytes_[i].data();
        f.planes[i].size = bytes_[i].size();
    }
    return f;
}
