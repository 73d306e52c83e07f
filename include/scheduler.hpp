#pragma once
#include <atomic>
#include <optional>
#include <stdexcept>
#include <utility>

#include "category_queue.hpp"
#include "job.hpp"
#include "statistics.hpp"
#include "types.hpp"

class FrameAlreadyActive : public std::logic_error {
public:
  FrameAlreadyActive() : std::logic_error("start_frame() called while a frame is active") {}
};

class Scheduler {
public:
  explicit Scheduler(BudgetProfile profile, TimeSource now = &Clock::now);

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Submission (any thread)
  JobDescriptor enqueue(JobCategory category, JobHandle handle, float cost_weight);
  void submit(JobDescriptor job);
  std::optional<JobDescriptor> dequeue(JobCategory category);
  size_t peek_depth(JobCategory category) const;
  size_t total_queued() const;

  // Frame lifecycle (drain thread)
  void start_frame();
  bool has_budget() const;
  std::optional<std::pair<JobCategory, JobDescriptor>> dequeue_job();
  void record_execution(JobCategory category, std::chrono::nanoseconds elapsed);
  void finish_frame();
  bool in_frame() const { return frame_start_.has_value(); }

  bool set_budget(double budget_ms);
  // Applies next only if the budget still equals expected; a concurrent
  // set_budget() wins.
  bool set_budget_if(double expected, double next);
  double budget_ms() const { return budget_ms_.load(std::memory_order_relaxed); }
  const BudgetProfile& profile() const { return profile_; }

  TimePoint now() const { return now_(); }
  const StatisticsAccumulator& stats() const { return stats_; }
  StatisticsSnapshot snapshot() const { return stats_.snapshot(); }
  void reset_stats() { stats_.reset(); }

private:
  CategoryQueue& queue(JobCategory c) { return queues_[category_index(c)]; }
  const CategoryQueue& queue(JobCategory c) const { return queues_[category_index(c)]; }

  BudgetProfile profile_;
  TimeSource now_;
  std::atomic<double> budget_ms_;
  std::atomic<uint64_t> next_sequence_{1};
  PerCategory<CategoryQueue> queues_;
  std::optional<TimePoint> frame_start_;
  StatisticsAccumulator stats_;
};
