#include "workload.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace {
const char* system_name(JobCategory c) {
  switch (c) {
    case JobCategory::Transform:     return "transform_sync";
    case JobCategory::Visibility:    return "visibility_cull";
    case JobCategory::Physics:       return "physics_step";
    case JobCategory::LevelOfDetail: return "lod_transition";
    case JobCategory::AI:            return "ai_think";
  }
  return "unknown";
}
}  // namespace

void spin_for_ms(double ms) {
  if (ms <= 0.0) return;
  const TimePoint start = Clock::now();
  while (elapsed_ms(start, Clock::now()) < ms) {
  }
}

SyntheticWorkload::SyntheticWorkload(const WorkloadConfig& cfg, SystemRegistry& registry)
    : cfg_(cfg), registry_(registry) {
  const double scale = cfg_.job_cost_scale_ms;
  for (JobCategory c : kPriorityOrder) {
    const CategoryLoad& l = cfg_.load[category_index(c)];
    handles_[category_index(c)] = registry.add_system(
        system_name(c), c, l.cost,
        [scale](const JobDescriptor& job) { spin_for_ms(job.cost_weight() * scale); });
  }
  spdlog::info("Synthetic workload: {} systems, cost scale {:.3f}ms", registry.size(), scale);
}

bool SyntheticWorkload::spike_frame(uint64_t frame_id) const {
  return cfg_.spike_every > 0 && frame_id > 0 &&
         frame_id % static_cast<uint64_t>(cfg_.spike_every) == 0;
}

size_t SyntheticWorkload::produce(Scheduler& scheduler, uint64_t frame_id) const {
  const bool spike = spike_frame(frame_id);
  size_t submitted = 0;
  for (JobCategory c : kPriorityOrder) {
    int n = cfg_.load[category_index(c)].jobs_per_frame;
    if (spike && (c == JobCategory::LevelOfDetail || c == JobCategory::AI))
      n *= cfg_.spike_multiplier;
    for (int i = 0; i < n; ++i) {
      if (registry_.enqueue(scheduler, handles_[category_index(c)])) submitted++;
    }
  }
  if (spike) spdlog::debug("Frame {}: load spike, {} jobs submitted", frame_id, submitted);
  return submitted;
}
