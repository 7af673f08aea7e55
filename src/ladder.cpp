/**
 * @file ladder.cpp
 * @brief Resolution ladder implementation
 */

#include "hls_pack/ladder.hpp"

#include <algorithm>
#include <cmath>

namespace hls_pack {

int bitrate_for_rung(int height) {
  const auto &front = BITRATE_TABLE.front();
  const auto &back = BITRATE_TABLE.back();

  double kbps;
  if (height <= front.first) {
    kbps = static_cast<double>(front.second) * height / front.first;
  } else if (height >= back.first) {
    kbps = static_cast<double>(back.second) * height / back.first;
  } else {
    auto upper = std::lower_bound(
        BITRATE_TABLE.begin(), BITRATE_TABLE.end(), height,
        [](const std::pair<int, int> &e, int h) { return e.first < h; });
    if (upper->first == height)
      return upper->second;
    auto lower = upper - 1;
    double t = static_cast<double>(height - lower->first) /
               (upper->first - lower->first);
    kbps = lower->second + t * (upper->second - lower->second);
  }
  return std::max(1, static_cast<int>(std::lround(kbps)));
}

int width_for_rung(int rung, std::optional<int> source_width,
                   std::optional<int> source_height) {
  if (!source_width || !source_height || *source_width <= 0 ||
      *source_height <= 0)
    return AUTO_WIDTH;

  double aspect = static_cast<double>(*source_width) / *source_height;
  int width = static_cast<int>(std::round(rung * aspect / 2.0)) * 2;
  return width > 0 ? width : AUTO_WIDTH;
}

std::vector<RenditionSpec> plan_ladder(const std::vector<int> &candidates,
                                       std::optional<int> source_width,
                                       std::optional<int> source_height) {
  std::vector<RenditionSpec> ladder;
  ladder.reserve(candidates.size());

  bool height_known = source_height && *source_height > 0;
  for (int rung : candidates) {
    if (height_known && rung > *source_height)
      continue;
    ladder.push_back({rung,
                      height_known
                          ? width_for_rung(rung, source_width, source_height)
                          : AUTO_WIDTH,
                      bitrate_for_rung(rung)});
  }
  return ladder;
}

} // namespace hls_pack
