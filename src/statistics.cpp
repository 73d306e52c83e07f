#include "statistics.hpp"

#include <algorithm>

namespace {
double to_ms(std::chrono::nanoseconds d) {
  return std::chrono::duration<double, std::milli>(d).count();
}
}  // namespace

void StatisticsAccumulator::begin_frame(double budget_ms) {
  s_.jobs_executed = 0;
  s_.jobs_deferred = 0;
  s_.elapsed_ms = 0;
  s_.budget_ms = budget_ms;
  s_.budget_utilization = 0;
  s_.frame_avg_job_ms = 0;
  s_.frame_max_wait_ms = 0;
  s_.overrun = false;
  s_.executed_per_category.fill(0);
  s_.depth_per_category.fill(0);
  frame_exec_ms_ = 0;
}

void StatisticsAccumulator::record_execution(JobCategory category,
                                             std::chrono::nanoseconds elapsed) {
  const double ms = std::max(0.0, to_ms(elapsed));
  const size_t i = category_index(category);

  s_.jobs_executed++;
  s_.executed_per_category[i]++;
  frame_exec_ms_ += ms;
  s_.frame_avg_job_ms = frame_exec_ms_ / static_cast<double>(s_.jobs_executed);

  s_.total_jobs_executed++;
  s_.total_per_category[i]++;
  total_exec_ms_ += ms;
  s_.avg_job_ms = total_exec_ms_ / static_cast<double>(s_.total_jobs_executed);
}

void StatisticsAccumulator::record_wait(JobCategory /*category*/, std::chrono::nanoseconds wait) {
  const double ms = to_ms(wait);
  if (ms > s_.frame_max_wait_ms) s_.frame_max_wait_ms = ms;
  if (ms > s_.max_wait_ms) s_.max_wait_ms = ms;
}

void StatisticsAccumulator::set_frame_timing(double elapsed_ms, double budget_ms,
                                             const PerCategory<uint64_t>& depths) {
  s_.elapsed_ms = elapsed_ms;
  s_.budget_ms = budget_ms;
  s_.depth_per_category = depths;
}

void StatisticsAccumulator::record_frame_summary(double budget_used_ratio,
                                                 uint64_t deferred_count, uint64_t peak_depth) {
  s_.budget_utilization = budget_used_ratio;
  s_.jobs_deferred = deferred_count;
  s_.overrun = budget_used_ratio > 1.0;

  s_.total_frames++;
  s_.total_jobs_deferred += deferred_count;
  if (s_.overrun) s_.overrun_frames++;
  if (peak_depth > s_.peak_queue_depth) s_.peak_queue_depth = peak_depth;

  total_utilization_ += budget_used_ratio;
  s_.avg_utilization = total_utilization_ / static_cast<double>(s_.total_frames);
}

void StatisticsAccumulator::reset() {
  s_ = StatisticsSnapshot{};
  frame_exec_ms_ = 0;
  total_exec_ms_ = 0;
  total_utilization_ = 0;
}
