#pragma once
#include <deque>
#include <mutex>
#include <optional>

#include "job.hpp"

// FIFO of pending jobs for one category. Appends may come from producer
// threads; the drain thread is the only consumer.
class CategoryQueue {
public:
  void push(JobDescriptor job);
  std::optional<JobDescriptor> pop();
  size_t depth() const;
  bool empty() const;

  // High-water mark since the previous call; restarts from the current depth.
  size_t take_peak();

private:
  mutable std::mutex mu_;
  std::deque<JobDescriptor> jobs_;
  size_t peak_{0};
};
