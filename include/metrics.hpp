#pragma once
#include <algorithm>
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "statistics.hpp"

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct LatencySnapshot {
  double drain_p50{0}, drain_p95{0}, drain_p99{0};
  double job_p50{0}, job_p95{0}, job_p99{0};
  double util_p50{0}, util_p95{0}, util_p99{0};
  double overrun_rate{0};
  double fps{0};
};

class MetricsRegistry {
public:
  void add_drain(double ms) { drain_.add(ms); }
  void add_job(double ms) { job_.add(ms); }
  void add_utilization(double ratio) { util_.add(ratio); }

  // Folds one finished frame into the histograms and counters.
  void observe_frame(const StatisticsSnapshot& s);

  void inc_frame() { frames_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_overrun() { overrun_total_.fetch_add(1, std::memory_order_relaxed); }

  uint64_t frames_total() const { return frames_total_.load(std::memory_order_relaxed); }
  uint64_t overrun_total() const { return overrun_total_.load(std::memory_order_relaxed); }

  LatencySnapshot snapshot() const;
  std::string prometheus_text(const LatencySnapshot& l, const StatisticsSnapshot& s) const;

private:
  RollingHist drain_, job_, util_;
  std::atomic<uint64_t> frames_total_{0};
  std::atomic<uint64_t> overrun_total_{0};
};
