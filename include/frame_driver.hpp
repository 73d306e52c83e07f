#pragma once
#include <functional>

#include "job.hpp"
#include "scheduler.hpp"
#include "statistics.hpp"

using JobRunner = std::function<void(const JobDescriptor&)>;

struct DrainLimits {
  int max_jobs_per_frame{0};  // 0 = unlimited
};

struct FrameReport {
  uint64_t frame_id{0};
  StatisticsSnapshot stats;
  bool job_cap_hit{false};
};

// One drain pass: start_frame, dequeue while has_budget, finish_frame.
// The budget is checked before each dequeue, so the last job may overrun it.
FrameReport drain_frame(Scheduler& scheduler, const JobRunner& run_job,
                        const DrainLimits& limits = {});
