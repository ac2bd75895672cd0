#pragma once

#include "cancel_token.h"
#include "config.h"
#include "frame_buffer.h"
#include "geometry.h"
#include "sampler.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

enum class RenderOutcome { Completed, Cancelled, Resized };

const char* to_string(RenderOutcome outcome);

// Pixels that fit in target_interval if batch_len pixels took elapsed
// seconds. Never less than 1, also for zero or non-finite measurements.
size_t rescale_batch(size_t batch_len, double target_interval, double elapsed);

// Renders every row of one surface once, one logical task per row, on a
// fixed pool of worker threads.
class RowScheduler {
public:
    RowScheduler(const Scene& scene, RenderTarget& target, SurfaceSize size,
                 const RenderConfig& config, CancelToken token,
                 std::atomic<int>& rows_done);

    // Initial pixels-per-batch estimate from one timed single-pixel sample.
    size_t calibrate();

    // Returns once every row is flushed or the first row aborts. Rethrows the
    // first exception raised by a worker after all workers have exited.
    RenderOutcome run(size_t initial_batch);

    int worker_count() const;

private:
    struct Worker {
        std::mt19937 rng;
        std::vector<uint8_t> row;  // RGBA8, one scanline
        size_t batch;
    };

    RenderOutcome render_row(int row, Worker& w);

    const Scene& scene_;
    RenderTarget& target_;
    SurfaceSize size_;
    RenderConfig config_;
    CancelToken token_;
    std::atomic<int>& rows_done_;
    Camera camera_;
};
