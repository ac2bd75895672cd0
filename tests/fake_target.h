#pragma once

#include "frame_buffer.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <vector>

// In-memory host. Optionally holds every flush at a gate so tests can change
// the world (cancel, resize) while workers are mid-render.
class FakeTarget : public RenderTarget {
public:
    explicit FakeTarget(SurfaceSize size) : frame(size) {}

    SurfaceSize current_surface_size() override { return frame.size(); }

    void request_redraw() override { redraws++; }

    FrameLock lock_frame_buffer() override {
        {
            std::unique_lock<std::mutex> lk(gate_mutex_);
            entered_ = true;
            gate_cv_.notify_all();
            gate_cv_.wait(lk, [this] { return !gate_closed_; });
        }
        if (fail_on_lock) throw std::runtime_error("frame buffer lost");
        return frame.lock();
    }

    void close_gate() {
        std::lock_guard<std::mutex> lk(gate_mutex_);
        gate_closed_ = true;
    }

    void open_gate() {
        std::lock_guard<std::mutex> lk(gate_mutex_);
        gate_closed_ = false;
        gate_cv_.notify_all();
    }

    bool wait_until_entered(std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lk(gate_mutex_);
        return gate_cv_.wait_for(lk, timeout, [this] { return entered_; });
    }

    bool untouched() const {
        std::vector<uint8_t> px = frame.snapshot();
        return std::all_of(px.begin(), px.end(), [](uint8_t b) { return b == 0; });
    }

    // RGBA at column x, row y (row 0 at the top).
    std::vector<uint8_t> pixel(int x, int y) const {
        std::vector<uint8_t> px = frame.snapshot();
        size_t i = ((size_t)y * frame.size().width + x) * 4;
        return std::vector<uint8_t>(px.begin() + i, px.begin() + i + 4);
    }

    FrameBuffer frame;
    std::atomic<int> redraws{0};
    std::atomic<bool> fail_on_lock{false};

private:
    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    bool gate_closed_ = false;
    bool entered_ = false;
};
