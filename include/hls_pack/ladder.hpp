/**
 * @file ladder.hpp
 * @brief Resolution ladder planning for video renditions
 *
 * @details Derives the video renditions to encode from the source's native
 *          size:
 *
 *          - Candidate rungs above the native height are dropped
 *
 *          - Widths keep the source aspect ratio and are rounded to even
 *
 *          - Bitrates come from a fixed table, with a derived fallback for
 *            rungs the table does not list
 */

#ifndef HLS_PACK_LADDER_HPP
#define HLS_PACK_LADDER_HPP

#include <array>
#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"

namespace hls_pack {

/// Default candidate rungs, ascending
constexpr std::array<int, 6> DEFAULT_RUNGS = {240, 360, 480, 720, 1080, 2160};

/// Tabulated video bitrates (rung height, kbps), ascending by height
constexpr std::array<std::pair<int, int>, 6> BITRATE_TABLE = {{
    {240, 400},
    {360, 800},
    {480, 1200},
    {720, 2500},
    {1080, 5000},
    {2160, 12000},
}};

/**
 * @brief Video bitrate for a rung, in kbps.
 *
 * @note Rungs in BITRATE_TABLE use the tabulated value. Other rungs are
 *       interpolated linearly between the nearest tabulated neighbours, or
 *       scaled proportionally from the nearest entry when outside the
 *       table's range. The result is always >= 1.
 */
int bitrate_for_rung(int height);

/**
 * @brief Even output width for a rung, preserving the source aspect ratio.
 *
 * @param rung Target height
 * @param source_width Native width (empty if unknown)
 * @param source_height Native height (empty if unknown)
 * @return round(rung * w / h / 2) * 2, or AUTO_WIDTH when the size is
 *         unknown or the computed width is not positive
 */
int width_for_rung(int rung, std::optional<int> source_width,
                   std::optional<int> source_height);

/**
 * @brief Plan the video ladder.
 *
 * @param candidates Candidate rungs, ascending and distinct
 * @param source_width Native width (empty if unknown)
 * @param source_height Native height (empty if unknown)
 * @return Rungs <= native height in ascending order; the full candidate list
 *         with AUTO_WIDTH when the height is unknown; empty when the native
 *         height is below every candidate
 */
std::vector<RenditionSpec> plan_ladder(const std::vector<int> &candidates,
                                       std::optional<int> source_width,
                                       std::optional<int> source_height);

} // namespace hls_pack

#endif // HLS_PACK_LADDER_HPP
