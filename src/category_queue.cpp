#include "category_queue.hpp"

#include <utility>

void CategoryQueue::push(JobDescriptor job) {
  std::lock_guard<std::mutex> g(mu_);
  jobs_.push_back(std::move(job));
  if (jobs_.size() > peak_) peak_ = jobs_.size();
}

std::optional<JobDescriptor> CategoryQueue::pop() {
  std::lock_guard<std::mutex> g(mu_);
  if (jobs_.empty()) return std::nullopt;
  JobDescriptor job = std::move(jobs_.front());
  jobs_.pop_front();
  return job;
}

size_t CategoryQueue::depth() const {
  std::lock_guard<std::mutex> g(mu_);
  return jobs_.size();
}

bool CategoryQueue::empty() const {
  std::lock_guard<std::mutex> g(mu_);
  return jobs_.empty();
}

size_t CategoryQueue::take_peak() {
  std::lock_guard<std::mutex> g(mu_);
  const size_t p = peak_;
  peak_ = jobs_.size();
  return p;
}
