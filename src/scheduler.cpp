#include "scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

Scheduler::Scheduler(BudgetProfile profile, TimeSource now)
    : profile_(profile), now_(std::move(now)), budget_ms_(profile.budget_ms) {
  if (!now_) now_ = &Clock::now;
  if (!(profile_.budget_ms > 0.0) || !std::isfinite(profile_.budget_ms)) {
    spdlog::warn("Scheduler: invalid budget {} ms, using 2.5 ms", profile_.budget_ms);
    profile_.budget_ms = 2.5;
    budget_ms_.store(2.5, std::memory_order_relaxed);
  }
}

JobDescriptor Scheduler::enqueue(JobCategory category, JobHandle handle, float cost_weight) {
  JobDescriptor job(category, handle, cost_weight, now_(),
                    next_sequence_.fetch_add(1, std::memory_order_relaxed));
  queue(category).push(job);
  return job;
}

void Scheduler::submit(JobDescriptor job) {
  const JobCategory c = job.category();
  queue(c).push(std::move(job));
}

std::optional<JobDescriptor> Scheduler::dequeue(JobCategory category) {
  return queue(category).pop();
}

size_t Scheduler::peek_depth(JobCategory category) const { return queue(category).depth(); }

size_t Scheduler::total_queued() const {
  size_t n = 0;
  for (const auto& q : queues_) n += q.depth();
  return n;
}

void Scheduler::start_frame() {
  if (frame_start_) {
    if (profile_.strict_frame_checks) throw FrameAlreadyActive();
    spdlog::error("Scheduler: start_frame() while a frame is active; ignoring");
    return;
  }
  frame_start_ = now_();
  stats_.begin_frame(budget_ms());
}

bool Scheduler::has_budget() const {
  if (!frame_start_) return true;
  return elapsed_ms(*frame_start_, now_()) < budget_ms();
}

std::optional<std::pair<JobCategory, JobDescriptor>> Scheduler::dequeue_job() {
  for (JobCategory c : kPriorityOrder) {
    auto job = queue(c).pop();
    if (!job) continue;
    if (frame_start_) stats_.record_wait(c, now_() - job->created_at());
    return std::make_pair(c, std::move(*job));
  }
  return std::nullopt;
}

void Scheduler::record_execution(JobCategory category, std::chrono::nanoseconds elapsed) {
  stats_.record_execution(category, elapsed);
}

void Scheduler::finish_frame() {
  if (!frame_start_) {
    spdlog::warn("Scheduler: finish_frame() without an active frame");
    return;
  }
  const double elapsed = elapsed_ms(*frame_start_, now_());
  frame_start_.reset();

  PerCategory<uint64_t> depths{};
  uint64_t deferred = 0;
  uint64_t peak = 0;
  for (JobCategory c : kPriorityOrder) {
    auto& q = queue(c);
    depths[category_index(c)] = q.depth();
    deferred += depths[category_index(c)];
    peak = std::max<uint64_t>(peak, q.take_peak());
  }

  const double budget = budget_ms();
  stats_.set_frame_timing(elapsed, budget, depths);
  stats_.record_frame_summary(elapsed / budget, deferred, peak);
}

bool Scheduler::set_budget(double budget_ms) {
  if (!(budget_ms > 0.0) || !std::isfinite(budget_ms)) {
    spdlog::warn("Scheduler: rejected budget {} ms (keeping {} ms)", budget_ms, this->budget_ms());
    return false;
  }
  budget_ms_.store(budget_ms, std::memory_order_relaxed);
  return true;
}

bool Scheduler::set_budget_if(double expected, double next) {
  if (!(next > 0.0) || !std::isfinite(next)) {
    spdlog::warn("Scheduler: rejected budget {} ms (keeping {} ms)", next, budget_ms());
    return false;
  }
  return budget_ms_.compare_exchange_strong(expected, next, std::memory_order_relaxed);
}
