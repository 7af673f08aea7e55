/**
 * @file tool_check.hpp
 * @brief Start-up checks of the external encoder and prober
 */

#ifndef HLS_PACK_TOOL_CHECK_HPP
#define HLS_PACK_TOOL_CHECK_HPP

#include <string>

#include "logging.hpp"

namespace hls_pack {

/**
 * @brief Check that both binaries run.
 * @note Runs "<tool> -version" for each; both must exit with status 0.
 * @return false if either is missing or broken
 */
bool verify_tools(const std::string &ffmpeg, const std::string &ffprobe,
                  Logger &log);

/**
 * @brief Check whether the encoder offers the NVENC H.264 encoder.
 * @note Looks for "h264_nvenc" in the output of "ffmpeg -codecs". Any
 *       failure counts as "not available".
 */
bool detect_hardware_encoder(const std::string &ffmpeg, Logger &log);

} // namespace hls_pack

#endif // HLS_PACK_TOOL_CHECK_HPP
