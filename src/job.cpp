#include "job.hpp"

#include <algorithm>
#include <cmath>

float clamp_cost(float cost_weight) {
  if (std::isnan(cost_weight)) return 0.0f;
  return std::clamp(cost_weight, 0.0f, 1.0f);
}

const char* category_name(JobCategory c) {
  switch (c) {
    case JobCategory::Transform:     return "transform";
    case JobCategory::Visibility:    return "visibility";
    case JobCategory::Physics:       return "physics";
    case JobCategory::LevelOfDetail: return "lod";
    case JobCategory::AI:            return "ai";
  }
  return "unknown";
}

bool parse_category(const std::string& name, JobCategory& out) {
  for (JobCategory c : kPriorityOrder) {
    if (name == category_name(c)) {
      out = c;
      return true;
    }
  }
  return false;
}
