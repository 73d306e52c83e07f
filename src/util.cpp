#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["scheduler"]) {
    auto n = y["scheduler"];
    if (n["budget_ms"]) c.scheduler.budget_ms = n["budget_ms"].as<double>();
    if (n["max_jobs_per_frame"])
      c.scheduler.max_jobs_per_frame = n["max_jobs_per_frame"].as<int>();
    if (n["strict_frame_checks"])
      c.scheduler.strict_frame_checks = n["strict_frame_checks"].as<bool>();
  }
  if (y["controller"]) {
    auto n = y["controller"];
    if (n["adaptive_budget"]) c.controller.enabled = n["adaptive_budget"].as<bool>();
    if (n["min_scale"]) c.controller.min_scale = n["min_scale"].as<double>();
    if (n["max_scale"]) c.controller.max_scale = n["max_scale"].as<double>();
    if (n["shrink_above_utilization"])
      c.controller.shrink_above_utilization = n["shrink_above_utilization"].as<double>();
    if (n["grow_below_utilization"])
      c.controller.grow_below_utilization = n["grow_below_utilization"].as<double>();
    if (n["shrink_factor"]) c.controller.shrink_factor = n["shrink_factor"].as<double>();
    if (n["grow_factor"]) c.controller.grow_factor = n["grow_factor"].as<double>();
    if (n["hysteresis_frames"]) c.controller.hysteresis_frames = n["hysteresis_frames"].as<int>();
  }
  if (y["loop"]) {
    if (y["loop"]["target_fps"]) c.loop.target_fps = y["loop"]["target_fps"].as<int>();
    if (y["loop"]["max_frames"]) c.loop.max_frames = y["loop"]["max_frames"].as<uint64_t>();
  }
  if (y["telemetry"] && y["telemetry"]["metrics_port"])
    c.metrics_port = y["telemetry"]["metrics_port"].as<int>();

  // Synthetic producers, one block per category name
  if (y["workload"]) {
    auto w = y["workload"];
    if (w["job_cost_scale_ms"])
      c.workload.job_cost_scale_ms = w["job_cost_scale_ms"].as<double>();
    if (w["spike_every"]) c.workload.spike_every = w["spike_every"].as<int>();
    if (w["spike_multiplier"]) c.workload.spike_multiplier = w["spike_multiplier"].as<int>();

    for (JobCategory cat : kPriorityOrder) {
      auto n = w[category_name(cat)];
      if (!n) continue;
      CategoryLoad& l = c.workload.load[category_index(cat)];
      if (n["jobs_per_frame"]) l.jobs_per_frame = n["jobs_per_frame"].as<int>();
      if (n["cost"]) l.cost = n["cost"].as<float>();
    }
  }

  if (y["output"]) {
    auto output = y["output"];

    // Logging settings
    if (output["logging"]) {
      auto lg = output["logging"];
      if (lg["verbose_logging"]) c.output_config.verbose_logging = lg["verbose_logging"].as<bool>();
      if (lg["log_level"]) c.output_config.log_level = lg["log_level"].as<std::string>();
      if (lg["performance_summary_interval"])
        c.output_config.performance_summary_interval =
            lg["performance_summary_interval"].as<int>();
    }

    // CSV logging settings
    if (output["csv"]) {
      auto csv = output["csv"];
      if (csv["enable_csv_logging"])
        c.output_config.enable_csv_logging = csv["enable_csv_logging"].as<bool>();
      if (csv["csv_output_path"])
        c.output_config.csv_output_path = csv["csv_output_path"].as<std::string>();
      if (csv["csv_comprehensive_mode"])
        c.output_config.csv_comprehensive_mode = csv["csv_comprehensive_mode"].as<bool>();
    }
  }

  if (c.scheduler.budget_ms <= 0.0) {
    spdlog::warn("Config: scheduler.budget_ms must be positive, using 2.5");
    c.scheduler.budget_ms = 2.5;
  }
  return c;
}
