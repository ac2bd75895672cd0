#include <doctest/doctest.h>

#include "fake_target.h"
#include "row_scheduler.h"

#include <atomic>
#include <limits>
#include <stdexcept>

namespace {

RenderConfig small_config() {
    RenderConfig cfg;
    cfg.samples_per_pixel = 2;
    cfg.max_depth = 4;
    cfg.threads = 3;
    return cfg;
}

}

TEST_SUITE("RowScheduler") {

TEST_CASE("batch rescaling tracks the target interval") {
    // 10 pixels in a quarter of a half-second budget
    CHECK(rescale_batch(10, 0.5, 0.25) == 20);
    CHECK(rescale_batch(10, 0.5, 1.0) == 5);
    CHECK(rescale_batch(7, 0.25, 0.25) == 7);
    CHECK(rescale_batch(3, 0.5, 0.125) == 12);
}

TEST_CASE("batch size never drops below one") {
    CHECK(rescale_batch(1, 0.010, 10.0) == 1);
    CHECK(rescale_batch(5, 0.010, 0.0) == 1);
    CHECK(rescale_batch(0, 0.010, 0.0) == 1);
    CHECK(rescale_batch(0, 0.010, 0.5) == 1);
    CHECK(rescale_batch(3, 0.010, std::numeric_limits<double>::quiet_NaN()) == 1);
    CHECK(rescale_batch(3, 0.010, -1.0) == 1);
}

TEST_CASE("tiny measurements stay bounded") {
    size_t b = rescale_batch(1000, 1.0, 1e-300);
    CHECK(b >= 1);
    CHECK(b < std::numeric_limits<size_t>::max() / 2);
}

TEST_CASE("calibration yields a positive estimate") {
    Scene scene = Scene::default_scene();
    FakeTarget target({8, 8});
    CancelSource source;
    std::atomic<int> rows(0);
    RowScheduler sched(scene, target, {8, 8}, small_config(), source.token(), rows);
    CHECK(sched.calibrate() >= 1);
}

TEST_CASE("worker pool is capped by row count") {
    Scene scene = Scene::default_scene();
    FakeTarget target({8, 2});
    CancelSource source;
    std::atomic<int> rows(0);
    RenderConfig cfg = small_config();
    cfg.threads = 16;
    RowScheduler sched(scene, target, {8, 2}, cfg, source.token(), rows);
    CHECK(sched.worker_count() == 2);
}

TEST_CASE("every pixel of every row is written once the render completes") {
    const SurfaceSize size{16, 8};
    Scene scene = Scene::default_scene();
    FakeTarget target(size);
    CancelSource source;
    std::atomic<int> rows(0);
    RowScheduler sched(scene, target, size, small_config(), source.token(), rows);

    SUBCASE("single-pixel batches") {
        CHECK(sched.run(1) == RenderOutcome::Completed);
    }
    SUBCASE("batch wider than a row") {
        CHECK(sched.run(1000) == RenderOutcome::Completed);
    }
    SUBCASE("calibrated batches") {
        CHECK(sched.run(sched.calibrate()) == RenderOutcome::Completed);
    }

    CHECK(rows.load() == size.height);
    std::vector<uint8_t> px = target.frame.snapshot();
    for (size_t i = 3; i < px.size(); i += 4) {
        REQUIRE(px[i] == 255);
    }
    // Rendering does not ask for a redraw; the job does.
    CHECK(target.redraws.load() == 0);
}

TEST_CASE("row zero is the top of the image") {
    const SurfaceSize size{16, 8};
    Scene scene = Scene::default_scene();
    FakeTarget target(size);
    CancelSource source;
    std::atomic<int> rows(0);
    RowScheduler sched(scene, target, size, small_config(), source.token(), rows);
    REQUIRE(sched.run(4) == RenderOutcome::Completed);

    // Top-left looks well above the horizon: pure sky, full blue.
    CHECK(target.pixel(0, 0)[2] == 255);
    // Around the image center the small sphere is hit; diffuse halves it.
    CHECK(target.pixel(8, 4)[2] <= 188);
    // Bottom rows look at the ground.
    CHECK(target.pixel(0, 7)[2] <= 188);
}

TEST_CASE("cancelled token stops every row before any write") {
    const SurfaceSize size{16, 8};
    Scene scene = Scene::default_scene();
    FakeTarget target(size);
    CancelSource source;
    CancelToken token = source.token();
    source.cancel();
    std::atomic<int> rows(0);
    RowScheduler sched(scene, target, size, small_config(), token, rows);

    CHECK(sched.run(4) == RenderOutcome::Cancelled);
    CHECK(rows.load() == 0);
    CHECK(target.untouched());
}

TEST_CASE("size mismatch is reported as a resize without writing") {
    Scene scene = Scene::default_scene();
    FakeTarget target({8, 8});
    CancelSource source;
    std::atomic<int> rows(0);
    RowScheduler sched(scene, target, {16, 8}, small_config(), source.token(), rows);

    CHECK(sched.run(4) == RenderOutcome::Resized);
    CHECK(rows.load() == 0);
    CHECK(target.untouched());
}

TEST_CASE("a failing worker is rethrown after the pool drains") {
    const SurfaceSize size{16, 8};
    Scene scene = Scene::default_scene();
    FakeTarget target(size);
    target.fail_on_lock = true;
    CancelSource source;
    std::atomic<int> rows(0);
    RowScheduler sched(scene, target, size, small_config(), source.token(), rows);

    CHECK_THROWS_AS(sched.run(4), std::runtime_error);
}

TEST_CASE("empty surface completes immediately") {
    Scene scene = Scene::default_scene();
    FakeTarget target({0, 0});
    CancelSource source;
    std::atomic<int> rows(0);
    RowScheduler sched(scene, target, {0, 0}, small_config(), source.token(), rows);
    CHECK(sched.run(1) == RenderOutcome::Completed);
}

}

TEST_SUITE("CancelToken") {

TEST_CASE("tokens observe cancel, replacement and destruction of the source") {
    SUBCASE("cancel") {
        CancelSource source;
        CancelToken t = source.token();
        CHECK_FALSE(t.cancelled());
        source.cancel();
        CHECK(t.cancelled());
    }
    SUBCASE("replace") {
        CancelSource source;
        CancelToken old_token = source.token();
        source = CancelSource();
        CHECK(old_token.cancelled());
        CHECK_FALSE(source.token().cancelled());
    }
    SUBCASE("destroy") {
        CancelToken t;
        {
            CancelSource source;
            t = source.token();
            CHECK_FALSE(t.cancelled());
        }
        CHECK(t.cancelled());
    }
    SUBCASE("default token") {
        CHECK(CancelToken().cancelled());
    }
}

}
