#pragma once
#include <cstdint>

#include "scheduler.hpp"
#include "system_registry.hpp"
#include "types.hpp"

struct CategoryLoad {
  int jobs_per_frame{4};
  float cost{0.2f};
};

struct WorkloadConfig {
  double job_cost_scale_ms{1.0};  // wall time of a cost_weight 1.0 job
  PerCategory<CategoryLoad> load{};
  int spike_every{0};             // frames; 0 disables spikes
  int spike_multiplier{4};        // applied to LOD and AI submissions
};

// Stand-in producers for the demo host: one registered system per category,
// each job spinning for cost_weight * job_cost_scale_ms.
class SyntheticWorkload {
public:
  SyntheticWorkload(const WorkloadConfig& cfg, SystemRegistry& registry);

  // Returns the number of jobs submitted.
  size_t produce(Scheduler& scheduler, uint64_t frame_id) const;

  bool spike_frame(uint64_t frame_id) const;
  JobHandle handle(JobCategory c) const { return handles_[category_index(c)]; }

private:
  WorkloadConfig cfg_;
  const SystemRegistry& registry_;
  PerCategory<JobHandle> handles_{};
};

void spin_for_ms(double ms);
