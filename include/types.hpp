#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using TimeSource = std::function<TimePoint()>;

// Opaque execution reference, resolved by SystemRegistry.
using JobHandle = uint64_t;

// Declaration order is drain priority.
enum class JobCategory : uint8_t { Transform, Visibility, Physics, LevelOfDetail, AI };

constexpr size_t kCategoryCount = 5;

constexpr std::array<JobCategory, kCategoryCount> kPriorityOrder{
    JobCategory::Transform, JobCategory::Visibility, JobCategory::Physics,
    JobCategory::LevelOfDetail, JobCategory::AI};

template <typename T>
using PerCategory = std::array<T, kCategoryCount>;

inline size_t category_index(JobCategory c) { return static_cast<size_t>(c); }
inline uint32_t category_priority(JobCategory c) { return static_cast<uint32_t>(c); }

const char* category_name(JobCategory c);
bool parse_category(const std::string& name, JobCategory& out);

inline double elapsed_ms(TimePoint from, TimePoint to) {
  return std::chrono::duration<double, std::milli>(to - from).count();
}

struct BudgetProfile {
  double budget_ms{2.5};
  int    max_jobs_per_frame{0};  // 0 = unlimited
#ifdef NDEBUG
  bool   strict_frame_checks{false};
#else
  bool   strict_frame_checks{true};
#endif
};

struct AdaptiveProfile {
  bool   enabled{false};
  double min_scale{0.5};
  double max_scale{2.0};
  double shrink_above_utilization{0.9};
  double grow_below_utilization{0.7};
  double shrink_factor{0.95};
  double grow_factor{1.05};
  int    hysteresis_frames{1};
};

struct BudgetPlan {
  double budget_ms{2.5};
  double scale{1.0};
  std::string reason;
};
