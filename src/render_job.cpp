#include "render_job.h"

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>

static std::string describe(const std::exception_ptr& e) {
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "non-standard exception";
    }
}

RenderJob::~RenderJob() {
    if (!thread_.joinable()) return;
    cancel_ = CancelSource();
    thread_.join();
    if (shared_->failure)
        fprintf(stderr, "Render job failed: %s\n", describe(shared_->failure).c_str());
}

void RenderJob::start(std::shared_ptr<const Scene> scene, RenderTarget& target,
                      const RenderConfig& config) {
    if (thread_.joinable())
        throw std::logic_error("RenderJob::start: previous render has not been joined");

    SurfaceSize size = target.current_surface_size();
    cancel_ = CancelSource();
    shared_ = std::make_shared<Shared>();
    shared_->rows_total = size.height;

    thread_ = std::thread([scene, &target, config, size,
                           token = cancel_.token(), shared = shared_]() {
        auto start = std::chrono::steady_clock::now();
        printf("Starting a renderer thread for window size %dx%d\n", size.width, size.height);
        fflush(stdout);
        try {
            RowScheduler scheduler(*scene, target, size, config, token, shared->rows_done);
            RenderOutcome outcome = scheduler.run(scheduler.calibrate());
            shared->outcome = outcome;
            switch (outcome) {
            case RenderOutcome::Completed: {
                double secs = std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - start).count();
                printf("Renderer thread finished in %.3fs\n", secs);
                fflush(stdout);
                target.request_redraw();
                break;
            }
            case RenderOutcome::Cancelled:
                printf("Render cancelled\n");
                fflush(stdout);
                break;
            case RenderOutcome::Resized:
                fprintf(stderr, "Renderer thread detected a resize, cancelling render\n");
                break;
            }
        } catch (...) {
            shared->failure = std::current_exception();
        }
        shared->finished.store(true, std::memory_order_release);
    });
}

bool RenderJob::is_running() {
    if (!thread_.joinable()) return false;
    if (!shared_->finished.load(std::memory_order_acquire)) return true;
    join();
    return false;
}

void RenderJob::restart(std::shared_ptr<const Scene> scene, RenderTarget& target,
                        const RenderConfig& config) {
    cancel_and_join();
    start(std::move(scene), target, config);
}

void RenderJob::request_cancel() {
    // Replacing the strong holder cancels every token handed out so far.
    cancel_ = CancelSource();
}

void RenderJob::cancel_and_join() {
    if (!thread_.joinable()) return;
    printf("Stopping renderer thread\n");
    fflush(stdout);
    request_cancel();
    join();
}

int RenderJob::rows_done() const {
    return shared_ ? shared_->rows_done.load(std::memory_order_relaxed) : 0;
}

int RenderJob::rows_total() const {
    return shared_ ? shared_->rows_total : 0;
}

void RenderJob::join() {
    thread_.join();
    if (shared_->failure) {
        std::exception_ptr failure = shared_->failure;
        shared_->failure = nullptr;
        last_outcome_.reset();
        std::rethrow_exception(failure);
    }
    last_outcome_ = shared_->outcome;
}
