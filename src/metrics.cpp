#include "metrics.hpp"

#include <sstream>

void MetricsRegistry::observe_frame(const StatisticsSnapshot& s) {
  add_drain(s.elapsed_ms);
  add_utilization(s.budget_utilization);
  if (s.jobs_executed > 0) add_job(s.frame_avg_job_ms);
  inc_frame();
  if (s.overrun) inc_overrun();
}

LatencySnapshot MetricsRegistry::snapshot() const {
  LatencySnapshot l{};
  l.drain_p50 = drain_.perc(50); l.drain_p95 = drain_.perc(95); l.drain_p99 = drain_.perc(99);
  l.job_p50 = job_.perc(50);     l.job_p95 = job_.perc(95);     l.job_p99 = job_.perc(99);
  l.util_p50 = util_.perc(50);   l.util_p95 = util_.perc(95);   l.util_p99 = util_.perc(99);
  const auto frames = frames_total_.load();
  const auto overruns = overrun_total_.load();
  l.overrun_rate = frames ? (static_cast<double>(overruns) / static_cast<double>(frames)) : 0.0;
  return l;
}

std::string MetricsRegistry::prometheus_text(const LatencySnapshot& l,
                                             const StatisticsSnapshot& s) const {
  std::ostringstream os;
  os << "framebudget_drain_ms{quantile=\"0.5\"} "  << l.drain_p50 << "\n";
  os << "framebudget_drain_ms{quantile=\"0.95\"} " << l.drain_p95 << "\n";
  os << "framebudget_drain_ms{quantile=\"0.99\"} " << l.drain_p99 << "\n";

  os << "framebudget_job_ms{quantile=\"0.5\"} "  << l.job_p50 << "\n";
  os << "framebudget_job_ms{quantile=\"0.95\"} " << l.job_p95 << "\n";
  os << "framebudget_job_ms{quantile=\"0.99\"} " << l.job_p99 << "\n";

  os << "framebudget_budget_ms " << s.budget_ms << "\n";
  os << "framebudget_budget_utilization " << s.budget_utilization << "\n";
  os << "framebudget_frames_total " << frames_total_.load() << "\n";
  os << "framebudget_overrun_frames_total " << overrun_total_.load() << "\n";
  os << "framebudget_overrun_rate " << l.overrun_rate << "\n";

  os << "framebudget_jobs_deferred " << s.jobs_deferred << "\n";
  os << "framebudget_jobs_executed_total " << s.total_jobs_executed << "\n";
  os << "framebudget_peak_queue_depth " << s.peak_queue_depth << "\n";

  for (JobCategory c : kPriorityOrder) {
    const size_t i = category_index(c);
    os << "framebudget_category_jobs_total{category=\"" << category_name(c) << "\"} "
       << s.total_per_category[i] << "\n";
    os << "framebudget_category_queue_depth{category=\"" << category_name(c) << "\"} "
       << s.depth_per_category[i] << "\n";
  }
  return os.str();
}
