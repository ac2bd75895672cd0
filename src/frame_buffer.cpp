#include "frame_buffer.h"

FrameBuffer::FrameBuffer(SurfaceSize size)
    : size_(size), pixels_(size.byte_length(), 0) {}

FrameLock FrameBuffer::lock() {
    return FrameLock(mutex_, pixels_);
}

void FrameBuffer::resize(SurfaceSize size) {
    std::lock_guard<std::mutex> guard(mutex_);
    size_ = size;
    pixels_.assign(size.byte_length(), 0);
}

SurfaceSize FrameBuffer::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return size_;
}

std::vector<uint8_t> FrameBuffer::snapshot() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return pixels_;
}
