#include "controller.hpp"

#include <algorithm>

BudgetPlan BudgetController::decide(const StatisticsSnapshot& s) {
  if (!ap_.enabled) return {base_budget_ms_, 1.0, "fixed"};

  if (s.budget_utilization > ap_.shrink_above_utilization) {
    over_count_++;
    under_count_ = 0;
  } else if (s.budget_utilization < ap_.grow_below_utilization) {
    under_count_++;
    over_count_ = 0;
  } else {
    if (over_count_ > 0)  over_count_--;
    if (under_count_ > 0) under_count_--;
  }

  const int hysteresis = std::max(1, ap_.hysteresis_frames);
  if (over_count_ >= hysteresis) {
    over_count_ = 0;
    scale_ = std::max(ap_.min_scale, scale_ * ap_.shrink_factor);
    return {base_budget_ms_ * scale_, scale_, "utilization above threshold"};
  }
  if (under_count_ >= hysteresis) {
    under_count_ = 0;
    scale_ = std::min(ap_.max_scale, scale_ * ap_.grow_factor);
    return {base_budget_ms_ * scale_, scale_, "utilization below threshold"};
  }
  return {base_budget_ms_ * scale_, scale_, "no-change"};
}

void BudgetController::rebase(double base_budget_ms) {
  base_budget_ms_ = base_budget_ms;
  scale_ = 1.0;
  over_count_ = 0;
  under_count_ = 0;
}
