#pragma once
#include <cstdint>

#include "types.hpp"

float clamp_cost(float cost_weight);

// Immutable once built; moved between queue and in-flight state.
class JobDescriptor {
public:
  JobDescriptor(JobCategory category, JobHandle handle, float cost_weight, TimePoint created_at,
                uint64_t sequence = 0)
      : category_(category),
        handle_(handle),
        cost_weight_(clamp_cost(cost_weight)),
        created_at_(created_at),
        sequence_(sequence) {}

  JobCategory category() const { return category_; }
  JobHandle handle() const { return handle_; }
  float cost_weight() const { return cost_weight_; }
  TimePoint created_at() const { return created_at_; }
  uint64_t sequence() const { return sequence_; }

private:
  JobCategory category_;
  JobHandle handle_;
  float cost_weight_;
  TimePoint created_at_;
  uint64_t sequence_;
};
