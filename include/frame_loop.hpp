#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "controller.hpp"
#include "frame_driver.hpp"
#include "metrics.hpp"
#include "output_manager.hpp"
#include "scheduler.hpp"
#include "system_registry.hpp"
#include "types.hpp"

struct LoopConfig {
  int target_fps{60};
  uint64_t max_frames{0};  // 0 = run until stop()
};

// Called at the top of every frame, before draining.
using Producer = std::function<void(Scheduler&, uint64_t frame_id)>;

struct LoopStats {
  uint64_t frames{0};
  uint64_t unknown_jobs{0};
  double fps{0};
  BudgetPlan plan{};
  StatisticsSnapshot sched{};
  LatencySnapshot latency{};
};

class FrameLoop {
public:
  FrameLoop(LoopConfig cfg, Scheduler& scheduler, const SystemRegistry& registry,
            MetricsRegistry& m, const AdaptiveProfile& adaptive, const OutputConfig& output_cfg,
            Producer producer = {});
  ~FrameLoop();

  void start();  // Start the frame loop in a background thread
  void stop();   // Stop and join thread
  bool running() const { return running_.load(); }

  // Runs frames on the calling thread; refused while the thread loop runs.
  uint64_t run_frames(uint64_t n);

  LoopStats stats() const;

private:
  FrameReport step();
  void publish(const FrameReport& report, const BudgetPlan& plan);

  LoopConfig cfg_;
  Scheduler& scheduler_;
  const SystemRegistry& registry_;
  MetricsRegistry& metrics_;
  BudgetController controller_;
  double applied_budget_ms_;
  std::unique_ptr<OutputManager> output_manager_;
  Producer producer_;

  uint64_t frame_id_{0};
  uint64_t unknown_jobs_{0};
  int frames_in_window_{0};
  TimePoint window_start_{};
  double fps_{0};

  mutable std::mutex stat_mu_;
  LoopStats last_stats_{};

  std::atomic<bool> running_{false};
  std::thread loop_thread_;
};
