/**
 * @file system.hpp
 * @brief System utilities, CPU detection and string helpers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Worker count calculation for the job pool
 *
 *          - Time formatting utilities
 *
 *          - Filename sanitization for output directory names
 */

#ifndef HLS_PACK_SYSTEM_HPP
#define HLS_PACK_SYSTEM_HPP

#include <string>

namespace hls_pack {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Calculate how many encoder processes may run at once.
 *
 * @note Encoders are multi-threaded themselves, so auto mode (configured = 0)
 *       uses a quarter of the CPU limit.
 *
 * @param configured Value of HLS_PARALLEL_JOBS
 * @return Worker count, at least 1
 */
int calculate_parallel_jobs(int configured);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Reduce a UTF-8 name to a portable directory name.
 *
 * @note The name is NFKD-normalized, so accented letters become their ASCII
 *       base letter. Spaces become underscores, and anything else outside
 *       [A-Za-z0-9_-] is dropped. Malformed UTF-8 sequences are skipped.
 *       The function is idempotent. Example: "Olá Mundo" -> "Ola_Mundo".
 */
std::string sanitize_filename(const std::string &name);

/// ASCII lower-case copy
std::string to_lower(std::string text);

} // namespace hls_pack

#endif // HLS_PACK_SYSTEM_HPP
