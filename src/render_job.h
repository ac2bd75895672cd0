#pragma once

#include "cancel_token.h"
#include "config.h"
#include "frame_buffer.h"
#include "geometry.h"
#include "row_scheduler.h"

#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <thread>

// Handle to at most one background render at a time.
//
// The target passed to start() must outlive the job (until cancel_and_join(),
// a restart, or the handle's destructor returns). An exception escaping the
// background thread is rethrown by whichever of is_running(), restart() or
// cancel_and_join() joins that thread.
class RenderJob {
public:
    RenderJob() = default;
    ~RenderJob();

    RenderJob(const RenderJob&) = delete;
    RenderJob& operator=(const RenderJob&) = delete;

    // Throws std::logic_error if a previous job has not been joined yet.
    void start(std::shared_ptr<const Scene> scene, RenderTarget& target,
               const RenderConfig& config);

    // Joins the thread if it has finished.
    bool is_running();

    void restart(std::shared_ptr<const Scene> scene, RenderTarget& target,
                 const RenderConfig& config);

    // Non-blocking: workers observe it at their next flush.
    void request_cancel();

    void cancel_and_join();

    int rows_done() const;
    int rows_total() const;

    // Outcome of the last joined job, empty if it failed or none ran.
    std::optional<RenderOutcome> last_outcome() const { return last_outcome_; }

private:
    struct Shared {
        std::atomic<bool> finished{false};
        std::atomic<int> rows_done{0};
        int rows_total = 0;
        // Written by the render thread before finished is set.
        RenderOutcome outcome = RenderOutcome::Completed;
        std::exception_ptr failure;
    };

    void join();

    std::thread thread_;
    CancelSource cancel_;
    std::shared_ptr<Shared> shared_;
    std::optional<RenderOutcome> last_outcome_;
};
