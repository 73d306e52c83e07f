#pragma once
#include <string>

#include "frame_loop.hpp"
#include "output_manager.hpp"
#include "types.hpp"
#include "workload.hpp"

struct AppConfig {
  BudgetProfile scheduler;
  AdaptiveProfile controller;
  LoopConfig loop;
  WorkloadConfig workload;
  OutputConfig output_config;
  int metrics_port{9090};
};

AppConfig load_config(const std::string& path);
