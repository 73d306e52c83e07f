#pragma once
#include "statistics.hpp"
#include "types.hpp"

class BudgetController {
public:
  BudgetController(double base_budget_ms, AdaptiveProfile ap)
      : base_budget_ms_(base_budget_ms), ap_(ap) {}
  BudgetPlan decide(const StatisticsSnapshot& s);

  // Adopts an externally set budget as the new base and restarts scaling.
  void rebase(double base_budget_ms);

  double base_budget_ms() const { return base_budget_ms_; }
  double scale() const { return scale_; }

private:
  double base_budget_ms_;
  AdaptiveProfile ap_;
  double scale_{1.0};
  int under_count_{0};
  int over_count_{0};
};
