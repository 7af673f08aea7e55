/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Values are read once per process; main() copies them into the
 *          option structs handed to each component.
 *
 */

#ifndef HLS_PACK_CONFIG_HPP
#define HLS_PACK_CONFIG_HPP

#include <cstdlib>
#include <string>
#include <vector>

namespace hls_pack {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not a number
 * @return Parsed integer value or default
 */
int get_env_int(const char *name, int default_val);

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Variable content or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : default_val;
}

/**
 * @brief Parse a comma-separated rung list such as "240,360,720".
 * @note Invalid and non-positive entries are skipped; the result is sorted
 *       ascending without duplicates.
 */
std::vector<int> parse_rung_list(const std::string &text);

/// Encoder binary
inline const std::string &ffmpeg_path() {
  static std::string val = get_env_string("HLS_FFMPEG", "ffmpeg");
  return val;
}

/// Prober binary
inline const std::string &ffprobe_path() {
  static std::string val = get_env_string("HLS_FFPROBE", "ffprobe");
  return val;
}

/**
 * @brief Remove the source file after a successful conversion
 * @see collect_cleanup_targets() for exactly what is removed
 */
inline bool delete_intermediates() {
  static bool val = (get_env_int("HLS_DELETE_INTERMEDIATES", 0) != 0);
  return val;
}

/**
 * @brief Number of encoder processes run concurrently for one file
 * @note 1 = strictly sequential. 0 = auto-detect from the CPU limit.
 */
inline int parallel_jobs() {
  static int val = get_env_int("HLS_PARALLEL_JOBS", 1);
  return val;
}

/// Persistent log file, empty = console only
inline const std::string &log_file() {
  static std::string val = get_env_string("HLS_LOG_FILE", "conversion.log");
  return val;
}

/// Container extension picked up by batch mode (case-insensitive)
inline const std::string &input_extension() {
  static std::string val = get_env_string("HLS_INPUT_EXTENSION", ".mkv");
  return val;
}

/**
 * @brief Candidate ladder rungs, ascending
 * @note Falls back to the default ladder if HLS_LADDER parses to nothing.
 */
const std::vector<int> &ladder_rungs();

/// Never use the hardware encoder, even when ffmpeg offers it
inline bool force_software() {
  static bool val = (get_env_int("HLS_FORCE_SOFTWARE", 0) != 0);
  return val;
}

/// Render the live progress display when stderr is a terminal
inline bool progress_display() {
  static bool val = (get_env_int("HLS_PROGRESS", 1) != 0);
  return val;
}

} // namespace Config
} // namespace hls_pack

#endif // HLS_PACK_CONFIG_HPP
