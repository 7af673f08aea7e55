/**
 * @file config.cpp
 * @brief Environment configuration helpers
 */

#include "hls_pack/config.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

#include "hls_pack/ladder.hpp"

namespace hls_pack {
namespace Config {

int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  try {
    return std::stoi(val);
  } catch (const std::exception &) {
    return default_val;
  }
}

std::vector<int> parse_rung_list(const std::string &text) {
  std::vector<int> rungs;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    try {
      size_t used = 0;
      int rung = std::stoi(item, &used);
      /// Reject trailing garbage like "720p"
      if (item.find_first_not_of(" \t", used) != std::string::npos)
        continue;
      if (rung > 0)
        rungs.push_back(rung);
    } catch (const std::exception &) {
      continue;
    }
  }
  std::sort(rungs.begin(), rungs.end());
  rungs.erase(std::unique(rungs.begin(), rungs.end()), rungs.end());
  return rungs;
}

const std::vector<int> &ladder_rungs() {
  static std::vector<int> val = [] {
    const char *env = std::getenv("HLS_LADDER");
    if (env) {
      auto parsed = parse_rung_list(env);
      if (!parsed.empty())
        return parsed;
    }
    return std::vector<int>(DEFAULT_RUNGS.begin(), DEFAULT_RUNGS.end());
  }();
  return val;
}

} // namespace Config
} // namespace hls_pack
