/**
 * @file track_classifier.hpp
 * @brief Partition probed streams into per-type track lists
 *
 * @details Each supported stream gets a 0-based index scoped to its type,
 *          with independent counters for video, audio and subtitle. Streams
 *          of any other type (data, attachments) are skipped and logged.
 */

#ifndef HLS_PACK_TRACK_CLASSIFIER_HPP
#define HLS_PACK_TRACK_CLASSIFIER_HPP

#include <string>

#include "logging.hpp"
#include "types.hpp"

namespace hls_pack {

/// Language reported for tracks without a language tag
constexpr const char *UNDEFINED_LANGUAGE = "und";

/// Map a prober codec_type string to a TrackType
TrackType track_type_from_codec(const std::string &codec_type);

/**
 * @brief Classify the streams of a container.
 * @note The returned tracks point into source.streams; source must outlive
 *       them.
 */
TrackLists classify_tracks(const SourceContainer &source, Logger &log);

/**
 * @brief Name shown to players for a track.
 * @return Title tag, else language tag, else "<Type>_<index>"
 *         (e.g. "Audio_1")
 */
std::string display_name(const Track &track);

/// Language tag of a track, or UNDEFINED_LANGUAGE
std::string language_code(const Track &track);

} // namespace hls_pack

#endif // HLS_PACK_TRACK_CLASSIFIER_HPP
