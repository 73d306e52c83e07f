#pragma once
#include <chrono>
#include <cstdint>

#include "types.hpp"

struct StatisticsSnapshot {
  // Current (or last finished) frame
  uint64_t jobs_executed{0};
  uint64_t jobs_deferred{0};
  double elapsed_ms{0};
  double budget_ms{0};
  double budget_utilization{0};  // elapsed / budget, may exceed 1.0
  double frame_avg_job_ms{0};
  double frame_max_wait_ms{0};
  bool overrun{false};
  PerCategory<uint64_t> executed_per_category{};
  PerCategory<uint64_t> depth_per_category{};

  // Cumulative since construction or reset()
  uint64_t total_frames{0};
  uint64_t total_jobs_executed{0};
  uint64_t total_jobs_deferred{0};
  uint64_t overrun_frames{0};
  uint64_t peak_queue_depth{0};
  double avg_job_ms{0};
  double avg_utilization{0};
  double max_wait_ms{0};
  PerCategory<uint64_t> total_per_category{};

  double budget_utilization_pct() const { return budget_utilization * 100.0; }
};

// Bookkeeping for the drain thread only; never throws, never locks.
class StatisticsAccumulator {
public:
  void begin_frame(double budget_ms);
  void record_execution(JobCategory category, std::chrono::nanoseconds elapsed);
  void record_wait(JobCategory category, std::chrono::nanoseconds wait);
  void record_frame_summary(double budget_used_ratio, uint64_t deferred_count, uint64_t peak_depth);

  // Set by the scheduler right before record_frame_summary().
  void set_frame_timing(double elapsed_ms, double budget_ms, const PerCategory<uint64_t>& depths);

  StatisticsSnapshot snapshot() const { return s_; }
  void reset();

private:
  StatisticsSnapshot s_{};
  double frame_exec_ms_{0};
  double total_exec_ms_{0};
  double total_utilization_{0};
};
