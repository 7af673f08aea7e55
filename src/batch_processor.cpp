/**
 * @file batch_processor.cpp
 * @brief Batch conversion implementation
 */

#include "hls_pack/batch_processor.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <system_error>

#include <fmt/color.h>
#include <fmt/core.h>

#include "hls_pack/system.hpp"

namespace hls_pack {

namespace fs = std::filesystem;

std::vector<fs::path> find_inputs(const fs::path &dir, const std::string &ext,
                                  Logger &log) {
  std::vector<fs::path> files;
  const std::string wanted = to_lower(ext);

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    log.error("Cannot read directory {}: {}", dir.string(), ec.message());
    return files;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      log.error("Error scanning {}: {}", dir.string(), ec.message());
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec))
      continue;
    if (to_lower(it->path().extension().string()) == wanted) {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

BatchProcessor::BatchProcessor(ConverterOptions options,
                               ProgressRegistry &registry, Logger &log)
    : converter_(options, registry, log), log_(log),
      parallel_jobs_(std::max(1, options.parallel_jobs)) {}

int BatchProcessor::process(const std::vector<fs::path> &input_files) {
  reports_.clear();
  errors_.clear();

  if (input_files.empty()) {
    log_.warn("No input files to process");
    return 0;
  }

  log_.phase("================== BATCH PROCESSING ==================");
  log_.info("Files to process: {}", input_files.size());
  log_.info("Parallel encoder jobs per file: {}", parallel_jobs_);
  log_.phase("======================================================");

  auto batch_start = std::chrono::steady_clock::now();

  int done = 0;
  for (const auto &file : input_files) {
    log_.info("Progress: {}/{}", ++done, input_files.size());
    try {
      FileReport report = converter_.convert(file);
      if (report.success()) {
        log_.success("Completed: {} ({:.1f}s)", file.filename().string(),
                     report.processing_time_us / 1000000.0);
      } else {
        log_.error("Failed: {}", file.filename().string());
      }
      reports_.push_back(std::move(report));
    } catch (const std::exception &e) {
      log_.error("Error while processing {}: {}", file.string(), e.what());
      errors_.push_back(file.filename().string());
    }
  }

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - batch_start)
                           .count();

  BatchTotals t = totals();
  log_.info("Batch finished: {} files, {} converted, {} failed, {} "
            "renditions, {} dropped, {}",
            t.files, t.converted, t.failed, t.renditions_produced,
            t.renditions_dropped, format_time(elapsed_sec));
  print_batch_summary(elapsed_sec);

  return t.failed;
}

BatchTotals BatchProcessor::totals() const {
  BatchTotals t;
  t.files = static_cast<int>(reports_.size() + errors_.size());
  t.failed = static_cast<int>(errors_.size());
  for (const auto &report : reports_) {
    if (report.success()) {
      t.converted++;
    } else {
      t.failed++;
    }
    t.renditions_produced += report.master.size();
    t.renditions_dropped += report.jobs_failed;
  }
  return t;
}

void BatchProcessor::print_batch_summary(double wall_clock_sec) const {
  BatchTotals t = totals();

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== BATCH CONVERSION SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", t.files);
  fmt::print("{:<25} {:>25}\n", "Converted:", t.converted);
  fmt::print("{:<25} {:>25}\n", "Failed:", t.failed);
  fmt::print("{:<25} {:>25}\n", "Renditions produced:", t.renditions_produced);
  fmt::print("{:<25} {:>25}\n", "Renditions dropped:", t.renditions_dropped);
  fmt::print("{:<25} {:>25}\n", "Parallel jobs:", parallel_jobs_);
  fmt::print("{:<25} {:>25}\n", "Wall-clock time:", format_time(wall_clock_sec));

  if (t.files > 0) {
    fmt::print("{:<25} {:>22.1f}s\n", "Average time per file:",
               wall_clock_sec / t.files);
  }

  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  std::fflush(stdout);

  /// List failed files if any
  if (t.failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &report : reports_) {
      if (!report.success()) {
        fmt::print(fg(fmt::color::red), "  - {}\n",
                   report.input.filename().string());
      }
    }
    for (const auto &name : errors_) {
      fmt::print(fg(fmt::color::red), "  - {}\n", name);
    }
    std::fflush(stdout);
  }
}

} // namespace hls_pack
