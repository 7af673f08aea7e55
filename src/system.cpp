/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Time formatting utilities
 *
 *          - UTF-8 to ASCII filename folding (NFKD via Boost.Locale)
 */

#include "hls_pack/system.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <locale>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/locale.hpp>
#include <fmt/core.h>

namespace hls_pack {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// ICU-backed locale, the only Boost.Locale backend that normalizes
const std::locale &unicode_locale() {
  static const std::locale loc = [] {
    boost::locale::localization_backend_manager backends =
        boost::locale::localization_backend_manager::global();
    backends.select("icu");
    boost::locale::generator gen(backends);
    return gen("en_US.UTF-8");
  }();
  return loc;
}

/// NFKD of valid UTF-8; malformed sequences are skipped first
std::string compatibility_decompose(const std::string &name) {
  std::string text = boost::locale::conv::utf_to_utf<char>(
      name, boost::locale::conv::skip);
  try {
    return boost::locale::normalize(text, boost::locale::norm_nfkd,
                                    unicode_locale());
  } catch (const std::exception &) {
    /// No normalizing backend: accented letters are dropped below
    return text;
  }
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        try {
          long quota = std::stol(quota_str);
          long period = std::stol(period_str);
          if (quota > 0 && period > 0) {
            limit = static_cast<int>((quota + period - 1) / period);
          }
        } catch (const std::exception &) {
          limit = -1;
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int calculate_parallel_jobs(int configured) {
  if (configured > 0)
    return configured;
  return std::max(1, detect_cpu_limit() / 4);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  if (seconds < 0)
    seconds = 0;
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string sanitize_filename(const std::string &name) {
  std::string out;
  out.reserve(name.size());

  /// Combining marks and anything without an ASCII decomposition are dropped
  for (char c : compatibility_decompose(name)) {
    if (c == ' ') {
      out += '_';
    } else if (static_cast<unsigned char>(c) < 0x80 &&
               (std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
                c == '_')) {
      out += c;
    }
  }
  return out;
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

} // namespace hls_pack
