#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

struct SurfaceSize {
    int width = 0, height = 0;
    size_t byte_length() const { return (size_t)width * (size_t)height * 4; }
    bool operator==(const SurfaceSize& o) const { return width == o.width && height == o.height; }
    bool operator!=(const SurfaceSize& o) const { return !(*this == o); }
};

// Exclusive access to the RGBA bytes of a FrameBuffer; released on destruction.
class FrameLock {
public:
    FrameLock(std::mutex& mutex, std::vector<uint8_t>& pixels)
        : lock_(mutex), pixels_(&pixels) {}

    uint8_t* data() { return pixels_->data(); }
    size_t size() const { return pixels_->size(); }

private:
    std::unique_lock<std::mutex> lock_;
    std::vector<uint8_t>* pixels_;
};

// RGBA8 surface shared between the host and render workers. Row 0 is the top
// scanline.
class FrameBuffer {
public:
    explicit FrameBuffer(SurfaceSize size = SurfaceSize());

    FrameLock lock();

    // Reallocates to the new size (cleared to zero). Workers still bound to the
    // old size see the length mismatch on their next flush.
    void resize(SurfaceSize size);

    SurfaceSize size() const;
    std::vector<uint8_t> snapshot() const;

private:
    mutable std::mutex mutex_;
    SurfaceSize size_;
    std::vector<uint8_t> pixels_;
};

// What a render job needs from its host.
class RenderTarget {
public:
    virtual ~RenderTarget() = default;

    // Queried once when a job starts; the job stays bound to this size.
    virtual SurfaceSize current_surface_size() = 0;

    // Called from the render thread once a job completes.
    virtual void request_redraw() = 0;

    virtual FrameLock lock_frame_buffer() = 0;
};
