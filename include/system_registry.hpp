#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "job.hpp"
#include "scheduler.hpp"
#include "types.hpp"

using SystemFn = std::function<void(const JobDescriptor&)>;

struct SystemRecord {
  std::string name;
  JobCategory category{JobCategory::Transform};
  float default_cost{0.5f};
  SystemFn fn;
};

// Resolves opaque job handles to the systems that execute them. Built at
// startup; read-only while frames are draining.
class SystemRegistry {
public:
  JobHandle add_system(std::string name, JobCategory category, float default_cost, SystemFn fn);

  std::optional<JobHandle> find(const std::string& name) const;
  const SystemRecord* get(JobHandle handle) const;
  size_t size() const { return systems_.size(); }

  // Runs the system behind the job's handle. Unknown handles are logged and
  // return false.
  bool run(const JobDescriptor& job) const;

  // Submits one job for a registered system using its category and cost.
  bool enqueue(Scheduler& scheduler, JobHandle handle) const;
  bool enqueue(Scheduler& scheduler, JobHandle handle, float cost_weight) const;

private:
  std::vector<SystemRecord> systems_;  // handle N lives at index N-1
};
