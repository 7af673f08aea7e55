/**
 * @file cleanup.hpp
 * @brief Removal of intermediate files after a successful conversion
 *
 * @details Cleanup never fails the conversion: every path that cannot be
 *          removed is logged and skipped.
 */

#ifndef HLS_PACK_CLEANUP_HPP
#define HLS_PACK_CLEANUP_HPP

#include <filesystem>
#include <vector>

#include "logging.hpp"
#include "types.hpp"

namespace hls_pack {

/**
 * @brief List the files cleanup would remove.
 *
 * @note Always the source file. For each rendition URI that is neither a
 *       manifest (.m3u8) nor a caption file (.vtt), every .ts file in that
 *       URI's directory is added as well. A missing directory is logged and
 *       skipped.
 *
 * @param source Original input file
 * @param root Output root the URIs are relative to
 * @param master Successful renditions
 */
std::vector<std::filesystem::path>
collect_cleanup_targets(const std::filesystem::path &source,
                        const std::filesystem::path &root,
                        const MasterPlaylist &master, Logger &log);

/**
 * @brief Remove each path.
 * @return Number of paths actually removed
 */
size_t remove_paths(const std::vector<std::filesystem::path> &paths,
                    Logger &log);

} // namespace hls_pack

#endif // HLS_PACK_CLEANUP_HPP
