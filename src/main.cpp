/**
 * @file main.cpp
 * @brief Entry point for the HLS packager
 *
 * @details Main entry point that handles:
 *
 *          - Start-up check of the encoder and prober binaries
 *
 *          - Hardware encoder detection
 *
 *          - Batch conversion of every matching container in a directory
 *
 * @note Usage: ./hls_pack [directory]. The directory defaults to the current
 *       working directory. Everything else is read from HLS_* environment
 *       variables (see config.hpp).
 */

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

#include "hls_pack/batch_processor.hpp"
#include "hls_pack/config.hpp"
#include "hls_pack/converter.hpp"
#include "hls_pack/logging.hpp"
#include "hls_pack/progress.hpp"
#include "hls_pack/system.hpp"
#include "hls_pack/tool_check.hpp"
#include "hls_pack/types.hpp"

using namespace hls_pack;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  namespace fs = std::filesystem;

  Logger log(Config::log_file());
  if (log.file_failed()) {
    log.warn("Cannot open log file {}, logging to the console only",
             Config::log_file());
  }

  if (argc > 2) {
    log.warn("Usage: ./hls_pack [directory]");
    return 1;
  }
  fs::path input_dir = argc == 2 ? fs::path(argv[1]) : fs::path(".");

  // **---- TOOL CHECK ----**

  if (!verify_tools(Config::ffmpeg_path(), Config::ffprobe_path(), log)) {
    log.error("{}: {} and {} are required. Aborting.",
              error_kind_name(ErrorKind::ToolUnavailable),
              Config::ffmpeg_path(), Config::ffprobe_path());
    return 1;
  }

  ConverterOptions options;
  options.encoder.ffmpeg = Config::ffmpeg_path();
  options.encoder.hardware =
      !Config::force_software() &&
      detect_hardware_encoder(Config::ffmpeg_path(), log);
  options.ffprobe = Config::ffprobe_path();
  options.ladder = Config::ladder_rungs();
  options.delete_intermediates = Config::delete_intermediates();
  options.parallel_jobs = calculate_parallel_jobs(Config::parallel_jobs());

  if (options.encoder.hardware) {
    log.info("CUDA detected. Using h264_nvenc for hardware-accelerated "
             "encoding.");
  } else {
    log.info("CUDA not detected. Using libx264 for software encoding.");
  }

  // **---- BATCH MODE ----**

  std::vector<fs::path> files =
      find_inputs(input_dir, Config::input_extension(), log);
  if (files.empty()) {
    log.info("No {} files found in {}", Config::input_extension(),
             input_dir.string());
    return 0;
  }
  log.info("Found {} {} files in {}", files.size(), Config::input_extension(),
           input_dir.string());

  ProgressRegistry registry;
  ProgressDisplay display(registry, stderr);
  bool show_progress = Config::progress_display() && ::isatty(STDERR_FILENO);
  if (show_progress)
    display.start();

  BatchProcessor processor(options, registry, log);
  int failures = processor.process(files);

  if (show_progress)
    display.stop();

  if (failures > 0) {
    log.warn("{} of {} files failed, see the log for details", failures,
             files.size());
  }
  log.success("All conversions completed.");
  return 0;
}
