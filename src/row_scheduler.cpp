#include "row_scheduler.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <exception>
#include <mutex>
#include <thread>

// Keeps the column cursor far away from overflow.
static const size_t MAX_BATCH = (size_t)1 << 24;

const char* to_string(RenderOutcome outcome) {
    switch (outcome) {
    case RenderOutcome::Completed: return "completed";
    case RenderOutcome::Cancelled: return "cancelled";
    case RenderOutcome::Resized: return "resized";
    }
    return "unknown";
}

size_t rescale_batch(size_t batch_len, double target_interval, double elapsed) {
    double estimate = std::floor((double)batch_len * target_interval / elapsed);
    if (!std::isfinite(estimate) || estimate < 1.0) return 1;
    if (estimate >= (double)MAX_BATCH) return MAX_BATCH;
    return (size_t)estimate;
}

static double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

RowScheduler::RowScheduler(const Scene& scene, RenderTarget& target, SurfaceSize size,
                           const RenderConfig& config, CancelToken token,
                           std::atomic<int>& rows_done)
    : scene_(scene), target_(target), size_(size), config_(config),
      token_(std::move(token)), rows_done_(rows_done) {
    camera_.origin = config.origin;
    camera_.focal_length = config.focal_length;
    double h = size.height > 0 ? (double)size.height : 1.0;
    camera_.viewport = Vec2(2.0 * size.width / h, 2.0);
}

size_t RowScheduler::calibrate() {
    std::mt19937 rng(std::random_device{}());
    auto start = std::chrono::steady_clock::now();
    Rgba8 px = sample_pixel(scene_, rng, camera_, Vec2(0, 0), Vec2(1, 1),
                            config_.samples_per_pixel, config_.max_depth);
    double elapsed = seconds_since(start);
    volatile uint8_t sink = px[0];
    (void)sink;
    return rescale_batch(1, config_.target_interval(), elapsed);
}

int RowScheduler::worker_count() const {
    int n = config_.threads > 0 ? config_.threads
                                : std::max(1, (int)std::thread::hardware_concurrency());
    return std::max(1, std::min(n, size_.height));
}

RenderOutcome RowScheduler::run(size_t initial_batch) {
    const int H = size_.height;
    std::atomic<int> next_row(0);
    std::atomic<bool> stop(false);

    std::mutex result_mutex;
    RenderOutcome outcome = RenderOutcome::Completed;
    std::exception_ptr failure;

    auto worker = [&]() {
        try {
            Worker w{std::mt19937(std::random_device{}()),
                     std::vector<uint8_t>((size_t)size_.width * 4, 0),
                     std::max<size_t>(initial_batch, 1)};
            while (!stop.load(std::memory_order_relaxed)) {
                int y = next_row.fetch_add(1);
                if (y >= H) break;
                RenderOutcome r = render_row(y, w);
                if (r != RenderOutcome::Completed) {
                    std::lock_guard<std::mutex> guard(result_mutex);
                    if (outcome == RenderOutcome::Completed && !failure) outcome = r;
                    stop = true;
                    break;
                }
                rows_done_.fetch_add(1);
            }
        } catch (...) {
            std::lock_guard<std::mutex> guard(result_mutex);
            if (!failure) failure = std::current_exception();
            stop = true;
        }
    };

    int num_threads = worker_count();
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++) threads.emplace_back(worker);
    for (auto& t : threads) t.join();

    if (failure) std::rethrow_exception(failure);
    return outcome;
}

RenderOutcome RowScheduler::render_row(int row, Worker& w) {
    const size_t W = (size_t)size_.width;
    const Vec2 pixel_size(1.0 / size_.width, 1.0 / size_.height);
    // Row 0 is the top scanline, which looks at the top of the viewport.
    const double v = (double)(size_.height - row - 1) / size_.height;

    size_t begin = 0;
    size_t end = std::min(w.batch, W);
    for (;;) {
        auto start = std::chrono::steady_clock::now();
        for (size_t x = begin; x < end; x++) {
            Vec2 uv((double)x / size_.width, v);
            Rgba8 px = sample_pixel(scene_, w.rng, camera_, uv, pixel_size,
                                    config_.samples_per_pixel, config_.max_depth);
            std::memcpy(&w.row[x * 4], px.data(), 4);
        }
        w.batch = rescale_batch(end - begin, config_.target_interval(), seconds_since(start));

        if (config_.trace_batches) {
            printf("Flushing pixels at row %d, columns [%zu, %zu)\n", row, begin, end);
            fflush(stdout);
        }
        {
            FrameLock frame = target_.lock_frame_buffer();
            if (token_.cancelled()) return RenderOutcome::Cancelled;
            if (frame.size() != size_.byte_length()) return RenderOutcome::Resized;
            if (end > begin) {
                std::memcpy(frame.data() + ((size_t)row * W + begin) * 4,
                            &w.row[begin * 4], (end - begin) * 4);
            }
        }

        begin = end;
        if (begin >= W) return RenderOutcome::Completed;
        end = std::min(begin + w.batch, W);
    }
}
