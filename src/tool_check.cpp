/**
 * @file tool_check.cpp
 * @brief External tool checks implementation
 */

#include "hls_pack/tool_check.hpp"

#include "hls_pack/job_builder.hpp"
#include "hls_pack/subprocess.hpp"

namespace hls_pack {

namespace {

bool tool_runs(const std::string &tool, Logger &log) {
  std::string out, err;
  int status = run_capture({tool, "-version"}, out, err);
  if (status != 0) {
    log.error("'{}' is not installed or not on the PATH (status {})", tool,
              status);
    return false;
  }
  return true;
}

} // anonymous namespace

bool verify_tools(const std::string &ffmpeg, const std::string &ffprobe,
                  Logger &log) {
  bool ok = tool_runs(ffmpeg, log);
  ok = tool_runs(ffprobe, log) && ok;
  if (ok)
    log.debug("{} and {} are installed and accessible", ffmpeg, ffprobe);
  return ok;
}

bool detect_hardware_encoder(const std::string &ffmpeg, Logger &log) {
  std::string out, err;
  int status = run_capture({ffmpeg, "-hide_banner", "-codecs"}, out, err);
  if (status != 0) {
    log.warn("Could not query {} codecs (status {})", ffmpeg, status);
    return false;
  }
  if (out.find(HARDWARE_VIDEO_CODEC) != std::string::npos) {
    log.debug("{} is available in {}", HARDWARE_VIDEO_CODEC, ffmpeg);
    return true;
  }
  log.debug("{} is not available in {}", HARDWARE_VIDEO_CODEC, ffmpeg);
  return false;
}

} // namespace hls_pack
