#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <stdexcept>
#include <filesystem>
#include <fstream>
#include <thread>
#include <chrono>
#include "frame_loop.hpp"
#include "manual_clock.hpp"
#include "output_manager.hpp"

class LoopConfigTest : public ::testing::Test {
protected:
    LoopConfig config;
};

TEST_F(LoopConfigTest, DefaultValues) {
    EXPECT_EQ(config.target_fps, 60);
    EXPECT_EQ(config.max_frames, 0u);
}

// Frame loop driven by a manual clock: each registered system advances time
// by cost_weight milliseconds, so every frame is deterministic.
class FrameLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        output_config.log_level = "off";
        output_config.enable_csv_logging = false;
        profile.budget_ms = 1.0;
        profile.strict_frame_checks = true;
        scheduler = std::make_unique<Scheduler>(profile, clock.source());
        physics = registry.add_system("physics", JobCategory::Physics, 0.25f,
                                      [this](const JobDescriptor& job) {
                                          clock.advance_us(std::llround(job.cost_weight() * 1000.0));
                                      });
    }

    std::unique_ptr<FrameLoop> make_loop(int jobs_per_frame,
                                         AdaptiveProfile adaptive = AdaptiveProfile{}) {
        return std::make_unique<FrameLoop>(
            loop_config, *scheduler, registry, metrics, adaptive, output_config,
            [this, jobs_per_frame](Scheduler& s, uint64_t) {
                for (int i = 0; i < jobs_per_frame; ++i) registry.enqueue(s, physics);
            });
    }

    ManualClock clock;
    BudgetProfile profile;
    LoopConfig loop_config;
    OutputConfig output_config;
    std::unique_ptr<Scheduler> scheduler;
    SystemRegistry registry;
    MetricsRegistry metrics;
    JobHandle physics{0};
};

TEST_F(FrameLoopTest, RunFramesPublishesStats) {
    auto loop = make_loop(2);
    EXPECT_EQ(loop->run_frames(3), 3u);

    auto s = loop->stats();
    EXPECT_EQ(s.frames, 3u);
    EXPECT_EQ(s.unknown_jobs, 0u);
    EXPECT_EQ(s.sched.jobs_executed, 2u);
    EXPECT_NEAR(s.sched.elapsed_ms, 0.5, 1e-9);
    EXPECT_EQ(s.sched.total_jobs_executed, 6u);
    EXPECT_EQ(s.plan.reason, "fixed");
    EXPECT_EQ(metrics.frames_total(), 3u);
    EXPECT_DOUBLE_EQ(s.latency.drain_p50, 0.5);
}

TEST_F(FrameLoopTest, OverloadDefersAndCountsOverruns) {
    auto loop = make_loop(6);
    loop->run_frames(2);

    auto s = loop->stats();
    // 0.25 ms jobs against 1.0 ms: four per frame
    EXPECT_EQ(s.sched.jobs_executed, 4u);
    EXPECT_EQ(s.sched.jobs_deferred, 4u);
    EXPECT_EQ(scheduler->total_queued(), 4u);
    EXPECT_EQ(metrics.overrun_total(), 0u);
}

TEST_F(FrameLoopTest, UnknownHandlesAreCounted) {
    auto loop = std::make_unique<FrameLoop>(
        loop_config, *scheduler, registry, metrics, AdaptiveProfile{}, output_config,
        [](Scheduler& s, uint64_t) { s.enqueue(JobCategory::AI, 77, 0.1f); });
    loop->run_frames(2);

    auto s = loop->stats();
    EXPECT_EQ(s.unknown_jobs, 2u);
    EXPECT_EQ(s.sched.total_jobs_executed, 2u);
}

TEST_F(FrameLoopTest, AdaptiveBudgetGrowsWhenIdle) {
    AdaptiveProfile adaptive{};
    adaptive.enabled = true;
    auto loop = make_loop(1, adaptive);
    loop->run_frames(1);

    // 0.25 of 1.0 ms is below the grow threshold
    auto s = loop->stats();
    EXPECT_EQ(s.plan.reason, "utilization below threshold");
    EXPECT_DOUBLE_EQ(scheduler->budget_ms(), 1.05);
}

TEST_F(FrameLoopTest, AdaptiveBudgetShrinksUnderPressure) {
    AdaptiveProfile adaptive{};
    adaptive.enabled = true;
    adaptive.min_scale = 0.9;
    auto loop = make_loop(8, adaptive);
    loop->run_frames(5);

    EXPECT_DOUBLE_EQ(scheduler->budget_ms(), 0.9);
    EXPECT_DOUBLE_EQ(loop->stats().plan.scale, 0.9);
}

TEST_F(FrameLoopTest, ExternalBudgetBecomesNewBase) {
    AdaptiveProfile adaptive{};
    adaptive.enabled = true;
    auto loop = make_loop(10, adaptive);
    loop->run_frames(1);

    ASSERT_TRUE(scheduler->set_budget(2.0));
    loop->run_frames(1);

    auto s = loop->stats();
    // Frame ran at the new budget; the controller scaled from 2.0, not 1.0
    EXPECT_DOUBLE_EQ(s.sched.budget_ms, 2.0);
    EXPECT_DOUBLE_EQ(s.plan.budget_ms, 2.0 * s.plan.scale);
}

TEST_F(FrameLoopTest, JobCapFromProfile) {
    profile.budget_ms = 100.0;
    profile.max_jobs_per_frame = 3;
    scheduler = std::make_unique<Scheduler>(profile, clock.source());
    auto loop = make_loop(5);
    loop->run_frames(1);

    EXPECT_EQ(loop->stats().sched.jobs_executed, 3u);
    EXPECT_EQ(scheduler->total_queued(), 2u);
}

TEST_F(FrameLoopTest, WritesFrameLogWhenEnabled) {
    auto dir = std::filesystem::temp_directory_path() / "framebudget_loop_tests";
    std::filesystem::remove_all(dir);
    output_config.enable_csv_logging = true;
    output_config.csv_output_path = (dir / "frames.csv").string();
    {
        auto loop = make_loop(1);
        loop->run_frames(4);
    }
    std::ifstream in(output_config.csv_output_path);
    int lines = 0;
    std::string line;
    while (std::getline(in, line)) lines++;
    EXPECT_EQ(lines, 5);
    std::filesystem::remove_all(dir);
}

// Real clock: background thread honours max_frames and stop()
class FrameLoopThreadTest : public ::testing::Test {
protected:
    void SetUp() override {
        output_config.log_level = "off";
        output_config.enable_csv_logging = false;
        loop_config.target_fps = 1000;
    }

    // Waits until the loop has published n more frames; false on timeout.
    bool wait_frames(const FrameLoop& loop, uint64_t n) {
        const uint64_t target = loop.stats().frames + n;
        for (int i = 0; i < 20000; ++i) {
            if (loop.stats().frames >= target) return true;
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
        return false;
    }

    BudgetProfile profile;
    LoopConfig loop_config;
    OutputConfig output_config;
    SystemRegistry registry;
    MetricsRegistry metrics;
};

TEST_F(FrameLoopThreadTest, StopsAtFrameLimit) {
    loop_config.max_frames = 5;
    Scheduler scheduler(profile);
    FrameLoop loop(loop_config, scheduler, registry, metrics, AdaptiveProfile{}, output_config);

    loop.start();
    for (int i = 0; i < 500 && loop.running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_FALSE(loop.running());
    EXPECT_EQ(loop.stats().frames, 5u);
    loop.stop();
}

TEST_F(FrameLoopThreadTest, RunFramesRefusedWhileRunning) {
    Scheduler scheduler(profile);
    FrameLoop loop(loop_config, scheduler, registry, metrics, AdaptiveProfile{}, output_config);

    loop.start();
    EXPECT_TRUE(loop.running());
    EXPECT_EQ(loop.run_frames(3), 0u);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    loop.stop();
    EXPECT_FALSE(loop.running());

    // Restart after stop
    loop.start();
    loop.stop();
    EXPECT_GT(loop.stats().frames, 0u);
}

TEST_F(FrameLoopThreadTest, ExternalBudgetSticksWhileRunning) {
    loop_config.target_fps = 1000000;
    Scheduler scheduler(profile);
    FrameLoop loop(loop_config, scheduler, registry, metrics, AdaptiveProfile{}, output_config);

    loop.start();
    int lost = 0;
    for (int i = 0; i < 2000; ++i) {
        const double want = 3.0 + i * 1e-3;
        ASSERT_TRUE(scheduler.set_budget(want));
        ASSERT_TRUE(wait_frames(loop, 3));
        if (scheduler.budget_ms() != want) lost++;
    }
    loop.stop();

    EXPECT_EQ(lost, 0);
    EXPECT_DOUBLE_EQ(loop.stats().plan.budget_ms, 3.0 + 1999 * 1e-3);
}

TEST_F(FrameLoopThreadTest, AdaptiveLoopAdoptsExternalBudget) {
    loop_config.target_fps = 1000000;
    AdaptiveProfile adaptive{};
    adaptive.enabled = true;
    adaptive.max_scale = 1.0;  // idle frames would otherwise keep growing it
    Scheduler scheduler(profile);
    FrameLoop loop(loop_config, scheduler, registry, metrics, adaptive, output_config);

    loop.start();
    for (int i = 0; i < 200; ++i) {
        const double want = 4.0 + i * 1e-3;
        ASSERT_TRUE(scheduler.set_budget(want));
        ASSERT_TRUE(wait_frames(loop, 3));
        EXPECT_DOUBLE_EQ(scheduler.budget_ms(), want);
    }
    loop.stop();
}

TEST_F(FrameLoopThreadTest, RestartsAfterFrameLimit) {
    loop_config.max_frames = 3;
    Scheduler scheduler(profile);
    FrameLoop loop(loop_config, scheduler, registry, metrics, AdaptiveProfile{}, output_config);

    for (int run = 1; run <= 2; ++run) {
        loop.start();
        for (int i = 0; i < 500 && loop.running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        EXPECT_FALSE(loop.running());
        EXPECT_EQ(loop.stats().frames, static_cast<uint64_t>(3 * run));
    }
    loop.stop();
}

TEST_F(FrameLoopThreadTest, ThrowingJobDoesNotStopLoop) {
    loop_config.max_frames = 5;
    std::atomic<int> calls{0};
    JobHandle flaky = registry.add_system("flaky", JobCategory::Physics, 0.1f,
                                          [&calls](const JobDescriptor&) {
                                              if (calls.fetch_add(1) == 0) {
                                                  throw std::runtime_error("first run fails");
                                              }
                                          });
    Scheduler scheduler(profile);
    FrameLoop loop(loop_config, scheduler, registry, metrics, AdaptiveProfile{}, output_config,
                   [this, flaky](Scheduler& s, uint64_t) { registry.enqueue(s, flaky); });

    loop.start();
    for (int i = 0; i < 500 && loop.running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    loop.stop();

    // The failed frame is closed but not published
    EXPECT_EQ(calls.load(), 5);
    EXPECT_EQ(loop.stats().frames, 4u);
    EXPECT_EQ(scheduler.snapshot().total_frames, 5u);
    EXPECT_FALSE(scheduler.in_frame());
}
