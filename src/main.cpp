#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "frame_loop.hpp"
#include "metrics.hpp"
#include "scheduler.hpp"
#include "system_registry.hpp"
#include "util.hpp"
#include "workload.hpp"

namespace {
nlohmann::json stats_json(const LoopStats& s) {
  const auto& st = s.sched;
  nlohmann::json per_category = nlohmann::json::object();
  for (JobCategory c : kPriorityOrder) {
    const size_t i = category_index(c);
    per_category[category_name(c)] = {{"executed", st.executed_per_category[i]},
                                      {"queued", st.depth_per_category[i]},
                                      {"total", st.total_per_category[i]}};
  }
  return nlohmann::json{{"frames", s.frames},
                        {"fps", s.fps},
                        {"budget_ms", st.budget_ms},
                        {"budget_scale", s.plan.scale},
                        {"budget_reason", s.plan.reason},
                        {"elapsed_ms", st.elapsed_ms},
                        {"budget_utilization_pct", st.budget_utilization_pct()},
                        {"jobs_executed", st.jobs_executed},
                        {"jobs_deferred", st.jobs_deferred},
                        {"overrun", st.overrun},
                        {"peak_queue_depth", st.peak_queue_depth},
                        {"avg_job_ms", st.avg_job_ms},
                        {"max_wait_ms", st.max_wait_ms},
                        {"overrun_frames", st.overrun_frames},
                        {"unknown_jobs", s.unknown_jobs},
                        {"drain_p95_ms", s.latency.drain_p95},
                        {"categories", per_category}};
}
}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"FrameBudget-RT: frame-budgeted priority job scheduler"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  uint64_t headless_frames = 0;
  cli_app.add_option("--frames", headless_frames, "Run N frames without the HTTP server, then exit");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "FrameBudget-RT v1.0.0" << std::endl;
    std::cout << "Priority-tiered, budget-enforced job dispatch for per-frame subsystems"
              << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("FrameBudget-RT starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Failed to load config '{}': {}", cfg_path, e.what());
    return 1;
  }

  Scheduler scheduler(app.scheduler);
  SystemRegistry registry;
  SyntheticWorkload workload(app.workload, registry);
  MetricsRegistry metrics;
  FrameLoop loop(app.loop, scheduler, registry, metrics, app.controller, app.output_config,
                 [&workload](Scheduler& s, uint64_t frame_id) { workload.produce(s, frame_id); });

  if (headless_frames > 0) {
    loop.run_frames(headless_frames);
    spdlog::info("Stats: {}", stats_json(loop.stats()).dump());
    return 0;
  }

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(std::string("{\"ready\":") + (loop.running() ? "true" : "false") + "}",
                    "application/json");
  });

  svr.Post("/scheduler/start", [&](const httplib::Request&, httplib::Response& res) {
    // The loop may have stopped itself at loop.max_frames
    if (!loop.running()) loop.start();
    res.set_content("{\"started\":true}", "application/json");
  });

  svr.Post("/scheduler/stop", [&](const httplib::Request&, httplib::Response& res) {
    if (loop.running()) loop.stop();
    res.set_content("{\"stopped\":true}", "application/json");
  });

  svr.Post("/scheduler/budget", [&](const httplib::Request& req, httplib::Response& res) {
    double ms = 0.0;
    bool parsed = false;
    if (req.has_param("ms")) {
      const std::string v = req.get_param_value("ms");
      char* end = nullptr;
      ms = std::strtod(v.c_str(), &end);
      parsed = end != v.c_str() && *end == '\0';
    }
    if (!parsed || !scheduler.set_budget(ms)) {
      res.status = 400;
      res.set_content("{\"error\":\"expected positive ms parameter\"}", "application/json");
      return;
    }
    spdlog::info("Budget set to {:.3f}ms via HTTP", ms);
    nlohmann::json j{{"budget_ms", scheduler.budget_ms()}};
    res.set_content(j.dump(), "application/json");
  });

  svr.Get("/scheduler/stats", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(stats_json(loop.stats()).dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    auto s = loop.stats();
    res.set_content(metrics.prometheus_text(s.latency, s.sched), "text/plain; version=0.0.4");
  });

  loop.start();

  spdlog::info("HTTP server listening on 0.0.0.0:{}", app.metrics_port);
  svr.listen("0.0.0.0", app.metrics_port);

  // Cleanup
  loop.stop();
  spdlog::info("Shutdown complete.");
  return 0;
}
