/**
 * @file playlist_writer.hpp
 * @brief HLS manifest assembly
 *
 * @details Writes:
 *
 *          - the single-entry subtitle playlist wrapping one WebVTT file
 *
 *          - the master (multivariant) playlist listing, in this order,
 *            audio renditions, subtitle renditions, a blank line, then one
 *            EXT-X-STREAM-INF/URI pair per video rendition
 *
 * @note Video and audio playlists are produced by the encoder itself.
 */

#ifndef HLS_PACK_PLAYLIST_WRITER_HPP
#define HLS_PACK_PLAYLIST_WRITER_HPP

#include <filesystem>
#include <string>

#include "logging.hpp"
#include "types.hpp"

namespace hls_pack {

/// Group ids used in EXT-X-MEDIA and referenced by EXT-X-STREAM-INF
constexpr const char *AUDIO_GROUP_ID = "audio";
constexpr const char *SUBTITLE_GROUP_ID = "subs";

/// Name of the master playlist in every output root
constexpr const char *MASTER_PLAYLIST_NAME = "master.m3u8";

/**
 * @brief Text of a subtitle playlist.
 * @note One EXTINF entry of the nominal segment duration, whatever the real
 *       caption duration is.
 */
std::string render_subtitle_playlist(const std::string &caption_file);

/**
 * @brief Write <dir>/subtitle.m3u8 referencing caption_file.
 * @return true on success
 */
bool write_subtitle_playlist(const std::filesystem::path &playlist,
                             const std::string &caption_file, Logger &log);

/**
 * @brief Text of the master playlist.
 *
 * @note Entries keep the order of the input vectors. Audio DEFAULT follows
 *       the source disposition; subtitles are always DEFAULT=NO. A video
 *       entry omits RESOLUTION when its width is AUTO_WIDTH, and references
 *       a group only when that group has entries.
 */
std::string render_master_playlist(const MasterPlaylist &master);

/**
 * @brief Write <root>/master.m3u8.
 * @return true on success; failures are logged
 */
bool write_master_playlist(const std::filesystem::path &root,
                           const MasterPlaylist &master, Logger &log);

/// Path of a file relative to root, with '/' separators
std::string relative_uri(const std::filesystem::path &file,
                         const std::filesystem::path &root);

} // namespace hls_pack

#endif // HLS_PACK_PLAYLIST_WRITER_HPP
