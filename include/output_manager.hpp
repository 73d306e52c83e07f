#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <string>

#include "frame_driver.hpp"
#include "types.hpp"

struct OutputConfig {
  // Logging settings
  bool verbose_logging = false;
  std::string log_level = "info";
  int performance_summary_interval = 30;  // seconds

  // CSV logging settings
  bool enable_csv_logging = true;
  std::string csv_output_path = "output/frame_log.csv";
  bool csv_comprehensive_mode = true;  // per-category columns vs. compact mode
};

struct PerformanceStats {
  uint64_t total_frames = 0;
  double total_drain_time = 0.0;
  uint64_t total_jobs = 0;
  uint64_t overrun_frames = 0;
  uint64_t frames_with_deferred = 0;
  uint64_t max_deferred = 0;

  std::chrono::steady_clock::time_point start_time;
  std::chrono::steady_clock::time_point last_summary;

  void reset() {
    total_frames = 0;
    total_drain_time = 0.0;
    total_jobs = 0;
    overrun_frames = 0;
    frames_with_deferred = 0;
    max_deferred = 0;
    start_time = std::chrono::steady_clock::now();
    last_summary = start_time;
  }

  double getAvgDrainTime() const {
    return total_frames > 0 ? total_drain_time / static_cast<double>(total_frames) : 0.0;
  }

  double getAvgJobsPerFrame() const {
    return total_frames > 0 ? static_cast<double>(total_jobs) / static_cast<double>(total_frames)
                            : 0.0;
  }

  double getFPS() const {
    auto now = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time);
    double seconds = static_cast<double>(duration.count()) / 1000.0;
    return seconds > 0 ? static_cast<double>(total_frames) / seconds : 0.0;
  }

  double getOverrunRate() const {
    return total_frames > 0
               ? static_cast<double>(overrun_frames) / static_cast<double>(total_frames) * 100.0
               : 0.0;
  }
};

class OutputManager {
public:
  explicit OutputManager(const OutputConfig& config);
  ~OutputManager();

  void cleanup();

  // Per-frame CSV row, verbose log line or periodic summary
  void processFrame(const FrameReport& report);

  void logFrameInfo(const FrameReport& report);
  void logPerformanceSummary(bool force = false);

  // CSV logging methods
  void initializeCSV();
  void writeCSVHeader();
  void writeCSVRow(const FrameReport& report);
  void closeCSV();

  bool isCSVOpen() const { return csv_file_.is_open(); }
  const PerformanceStats& stats() const { return stats_; }

private:
  OutputConfig config_;
  PerformanceStats stats_;

  std::ofstream csv_file_;
  bool csv_header_written_;
  bool cleaned_up_;
};
