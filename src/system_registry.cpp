#include "system_registry.hpp"

#include <spdlog/spdlog.h>

#include <utility>

JobHandle SystemRegistry::add_system(std::string name, JobCategory category, float default_cost,
                                     SystemFn fn) {
  if (find(name)) spdlog::warn("SystemRegistry: duplicate system name '{}'", name);
  SystemRecord rec{};
  rec.name = std::move(name);
  rec.category = category;
  rec.default_cost = clamp_cost(default_cost);
  rec.fn = std::move(fn);
  systems_.push_back(std::move(rec));
  spdlog::debug("Registered system '{}' ({}) as handle {}", systems_.back().name,
                category_name(category), systems_.size());
  return static_cast<JobHandle>(systems_.size());
}

std::optional<JobHandle> SystemRegistry::find(const std::string& name) const {
  for (size_t i = 0; i < systems_.size(); ++i) {
    if (systems_[i].name == name) return static_cast<JobHandle>(i + 1);
  }
  return std::nullopt;
}

const SystemRecord* SystemRegistry::get(JobHandle handle) const {
  if (handle == 0 || handle > systems_.size()) return nullptr;
  return &systems_[handle - 1];
}

bool SystemRegistry::run(const JobDescriptor& job) const {
  const SystemRecord* rec = get(job.handle());
  if (!rec) {
    spdlog::warn("SystemRegistry: unknown handle {} ({} job)", job.handle(),
                 category_name(job.category()));
    return false;
  }
  if (rec->fn) rec->fn(job);
  return true;
}

bool SystemRegistry::enqueue(Scheduler& scheduler, JobHandle handle) const {
  const SystemRecord* rec = get(handle);
  if (!rec) return false;
  scheduler.enqueue(rec->category, handle, rec->default_cost);
  return true;
}

bool SystemRegistry::enqueue(Scheduler& scheduler, JobHandle handle, float cost_weight) const {
  const SystemRecord* rec = get(handle);
  if (!rec) return false;
  scheduler.enqueue(rec->category, handle, cost_weight);
  return true;
}
