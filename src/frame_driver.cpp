#include "frame_driver.hpp"

#include <spdlog/spdlog.h>

FrameReport drain_frame(Scheduler& scheduler, const JobRunner& run_job,
                        const DrainLimits& limits) {
  FrameReport report{};
  int ran = 0;

  scheduler.start_frame();
  while (scheduler.has_budget()) {
    if (limits.max_jobs_per_frame > 0 && ran >= limits.max_jobs_per_frame) {
      report.job_cap_hit = true;
      break;
    }
    auto next = scheduler.dequeue_job();
    if (!next) break;

    const auto& [category, job] = *next;
    const TimePoint t0 = scheduler.now();
    try {
      if (run_job) run_job(job);
    } catch (...) {
      // Close the frame so the next start_frame() is not misuse.
      scheduler.record_execution(category, scheduler.now() - t0);
      scheduler.finish_frame();
      throw;
    }
    scheduler.record_execution(category, scheduler.now() - t0);
    ran++;
  }
  scheduler.finish_frame();

  report.stats = scheduler.snapshot();
  if (report.job_cap_hit) {
    spdlog::debug("Job cap of {} reached with {} jobs still queued", limits.max_jobs_per_frame,
                  report.stats.jobs_deferred);
  }
  return report;
}
