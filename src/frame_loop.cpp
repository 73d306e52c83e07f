#include "frame_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

using namespace std::chrono;

FrameLoop::FrameLoop(LoopConfig cfg, Scheduler& scheduler, const SystemRegistry& registry,
                     MetricsRegistry& m, const AdaptiveProfile& adaptive,
                     const OutputConfig& output_cfg, Producer producer)
    : cfg_(cfg),
      scheduler_(scheduler),
      registry_(registry),
      metrics_(m),
      controller_(scheduler.budget_ms(), adaptive),
      applied_budget_ms_(scheduler.budget_ms()),
      output_manager_(std::make_unique<OutputManager>(output_cfg)),
      producer_(std::move(producer)) {
  spdlog::info("Frame loop: {} fps target, {:.3f}ms scheduler budget, adaptive={}",
               cfg_.target_fps, scheduler_.budget_ms(), adaptive.enabled);
}

FrameLoop::~FrameLoop() {
  stop();
  output_manager_->cleanup();
}

FrameReport FrameLoop::step() {
  if (producer_) producer_(scheduler_, frame_id_);

  DrainLimits limits{};
  limits.max_jobs_per_frame = scheduler_.profile().max_jobs_per_frame;
  FrameReport report =
      drain_frame(scheduler_,
                  [this](const JobDescriptor& job) {
                    if (!registry_.run(job)) unknown_jobs_++;
                  },
                  limits);
  report.frame_id = frame_id_;

  metrics_.observe_frame(report.stats);
  output_manager_->processFrame(report);

  // A budget changed from outside (HTTP, tuning) becomes the new base.
  const double seen = scheduler_.budget_ms();
  if (seen != applied_budget_ms_) {
    spdlog::info("Budget changed externally to {:.3f}ms", seen);
    controller_.rebase(seen);
  }
  applied_budget_ms_ = seen;

  // Fixed plans never write the budget. Adaptive plans only replace the value
  // read above, so a concurrent external change survives and is rebased on
  // the next frame.
  const BudgetPlan plan = controller_.decide(report.stats);
  if (plan.reason != "fixed" && plan.budget_ms != seen) {
    spdlog::debug("Budget {:.3f}ms -> {:.3f}ms ({})", seen, plan.budget_ms, plan.reason);
    if (scheduler_.set_budget_if(seen, plan.budget_ms)) {
      applied_budget_ms_ = plan.budget_ms;
    } else {
      spdlog::debug("Budget plan superseded by an external change");
    }
  }

  publish(report, plan);
  frame_id_++;
  return report;
}

void FrameLoop::publish(const FrameReport& report, const BudgetPlan& plan) {
  frames_in_window_++;
  const auto now = Clock::now();
  if (window_start_ == TimePoint{}) window_start_ = now;
  const double win_secs = duration<double>(now - window_start_).count();
  if (win_secs >= 1.0) {
    fps_ = frames_in_window_ / win_secs;
    frames_in_window_ = 0;
    window_start_ = now;
  }

  LoopStats s{};
  s.frames = report.frame_id + 1;
  s.unknown_jobs = unknown_jobs_;
  s.fps = fps_;
  s.plan = plan;
  s.sched = report.stats;
  s.latency = metrics_.snapshot();

  std::lock_guard<std::mutex> g(stat_mu_);
  last_stats_ = s;
}

uint64_t FrameLoop::run_frames(uint64_t n) {
  if (running_) {
    spdlog::warn("run_frames() refused while the frame loop thread is running");
    return 0;
  }
  for (uint64_t i = 0; i < n; ++i) step();
  return n;
}

void FrameLoop::start() {
  if (running_.exchange(true)) return;
  if (loop_thread_.joinable()) loop_thread_.join();
  loop_thread_ = std::thread([this] {
    const double period_ms = 1000.0 / static_cast<double>(std::max(1, cfg_.target_fps));
    uint64_t frames = 0;

    spdlog::info("Starting frame loop");
    while (running_) {
      auto host_loop_t0 = Clock::now();

      try {
        step();
      } catch (const std::exception& e) {
        spdlog::error("Frame {} failed: {}", frame_id_, e.what());
      }
      frames++;
      if (cfg_.max_frames > 0 && frames >= cfg_.max_frames) {
        spdlog::info("Frame limit reached after {} frames", frames);
        break;
      }

      double elapsed = duration<double, std::milli>(Clock::now() - host_loop_t0).count();
      double to_sleep = period_ms - elapsed;
      if (to_sleep > 0) std::this_thread::sleep_for(duration<double, std::milli>(to_sleep));
    }
    running_ = false;
    spdlog::info("Frame loop stopped ({} jobs still queued)", scheduler_.total_queued());
  });
}

void FrameLoop::stop() {
  running_ = false;
  if (loop_thread_.joinable()) loop_thread_.join();
}

LoopStats FrameLoop::stats() const {
  std::lock_guard<std::mutex> g(stat_mu_);
  return last_stats_;
}
