#include "output_manager.hpp"

#include <spdlog/fmt/fmt.h>

#include <filesystem>

OutputManager::OutputManager(const OutputConfig& config)
    : config_(config), csv_header_written_(false), cleaned_up_(false) {
  // Set logging level
  if (config_.log_level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (config_.log_level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (config_.log_level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (config_.log_level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else if (config_.log_level == "off") {
    spdlog::set_level(spdlog::level::off);
  }

  stats_.reset();

  if (config_.enable_csv_logging) {
    initializeCSV();
  }

  if (!config_.verbose_logging) {
    spdlog::info("Verbose logging disabled - performance summaries every {}s",
                 config_.performance_summary_interval);
  }
}

OutputManager::~OutputManager() {
  cleanup();
}

void OutputManager::cleanup() {
  if (cleaned_up_) return;
  cleaned_up_ = true;

  closeCSV();
  logPerformanceSummary(true);
}

void OutputManager::processFrame(const FrameReport& report) {
  const auto& s = report.stats;
  stats_.total_frames++;
  stats_.total_drain_time += s.elapsed_ms;
  stats_.total_jobs += s.jobs_executed;
  if (s.overrun) stats_.overrun_frames++;
  if (s.jobs_deferred > 0) stats_.frames_with_deferred++;
  if (s.jobs_deferred > stats_.max_deferred) stats_.max_deferred = s.jobs_deferred;

  if (config_.enable_csv_logging) {
    writeCSVRow(report);
  }

  if (config_.verbose_logging) {
    logFrameInfo(report);
  } else {
    // Only log important events
    if (s.overrun) {
      spdlog::warn("BUDGET OVERRUN - Frame {}: {:.3f}ms of {:.3f}ms, {} jobs deferred",
                   report.frame_id, s.elapsed_ms, s.budget_ms, s.jobs_deferred);
    }
    logPerformanceSummary();
  }
}

void OutputManager::logFrameInfo(const FrameReport& report) {
  const auto& s = report.stats;
  std::string per_category;
  for (JobCategory c : kPriorityOrder) {
    per_category += fmt::format(" {}={}/{}", category_name(c),
                                s.executed_per_category[category_index(c)],
                                s.depth_per_category[category_index(c)]);
  }

  spdlog::info(
      "frame_id={} budget_ms={:.3f} drain_ms={:.3f} util={:.1f}% executed={} deferred={} "
      "max_wait_ms={:.3f}{}{}",
      report.frame_id, s.budget_ms, s.elapsed_ms, s.budget_utilization_pct(), s.jobs_executed,
      s.jobs_deferred, s.frame_max_wait_ms, per_category, s.overrun ? " [OVERRUN]" : "");
}

void OutputManager::logPerformanceSummary(bool force) {
  auto now = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - stats_.last_summary);

  if (!force && duration.count() < config_.performance_summary_interval) {
    return;
  }

  spdlog::info("=== SCHEDULER SUMMARY ===");
  spdlog::info("Frames drained: {}", stats_.total_frames);
  spdlog::info("Average FPS: {:.1f}", stats_.getFPS());
  spdlog::info("Average drain time: {:.3f}ms", stats_.getAvgDrainTime());
  spdlog::info("Average jobs per frame: {:.1f}", stats_.getAvgJobsPerFrame());
  spdlog::info("Budget overrun rate: {:.2f}%", stats_.getOverrunRate());
  spdlog::info("Frames with deferred jobs: {}/{} (max deferred {})",
               stats_.frames_with_deferred, stats_.total_frames, stats_.max_deferred);

  stats_.last_summary = now;
}

void OutputManager::initializeCSV() {
  if (!config_.enable_csv_logging) return;

  std::filesystem::path csv_path(config_.csv_output_path);
  std::filesystem::path directory = csv_path.parent_path();

  std::error_code ec;
  if (!directory.empty() && !std::filesystem::exists(directory, ec)) {
    std::filesystem::create_directories(directory, ec);
    if (ec) {
      spdlog::error("Failed to create CSV output directory {}: {}", directory.string(),
                    ec.message());
      config_.enable_csv_logging = false;
      return;
    }
    spdlog::info("Created CSV output directory: {}", directory.string());
  }

  csv_file_.open(config_.csv_output_path, std::ios::out | std::ios::trunc);
  if (!csv_file_.is_open()) {
    spdlog::error("Failed to open CSV file for writing: {}", config_.csv_output_path);
    config_.enable_csv_logging = false;
    return;
  }

  writeCSVHeader();
  csv_header_written_ = true;

  spdlog::info("CSV logging initialized: {}", config_.csv_output_path);
}

void OutputManager::writeCSVHeader() {
  if (!csv_file_.is_open()) return;

  csv_file_ << "frame_id,budget_ms,elapsed_ms,utilization,executed,deferred,overrun";
  if (config_.csv_comprehensive_mode) {
    for (JobCategory c : kPriorityOrder) csv_file_ << "," << category_name(c) << "_executed";
    for (JobCategory c : kPriorityOrder) csv_file_ << "," << category_name(c) << "_depth";
    csv_file_ << ",max_wait_ms";
  }
  csv_file_ << "\n";
  csv_file_.flush();
}

void OutputManager::writeCSVRow(const FrameReport& report) {
  if (!csv_file_.is_open()) return;

  const auto& s = report.stats;
  csv_file_ << report.frame_id << "," << s.budget_ms << "," << s.elapsed_ms << ","
            << s.budget_utilization << "," << s.jobs_executed << "," << s.jobs_deferred << ","
            << (s.overrun ? 1 : 0);
  if (config_.csv_comprehensive_mode) {
    for (uint64_t n : s.executed_per_category) csv_file_ << "," << n;
    for (uint64_t n : s.depth_per_category) csv_file_ << "," << n;
    csv_file_ << "," << s.frame_max_wait_ms;
  }
  csv_file_ << "\n";

  // Periodic flush to ensure data is written
  if (report.frame_id % 100 == 0) {
    csv_file_.flush();
  }
}

void OutputManager::closeCSV() {
  if (csv_file_.is_open()) {
    csv_file_.flush();
    csv_file_.close();
    if (config_.enable_csv_logging) {
      spdlog::info("CSV logging completed: {}", config_.csv_output_path);
    }
  }
}
