/**
 * @file types.hpp
 * @brief Core data types and constants for HLS Pack
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - HLS packaging constants
 *
 *          - Stream and SourceContainer for probed metadata
 *
 *          - RenditionSpec and Job for the encode plan
 *
 *          - Rendition results collected for the master playlist
 */

#ifndef HLS_PACK_TYPES_HPP
#define HLS_PACK_TYPES_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hls_pack {

// **----- CONSTANTS -----**

/// Target duration of every media segment, in seconds
constexpr int SEGMENT_DURATION_SEC = 10;

/**
 * @brief Progress total used when the container reports no duration.
 * @note Keeps the progress display meaningful at the cost of an inaccurate
 *       total.
 */
constexpr double PLACEHOLDER_DURATION_SEC = 100.0;

/// Width value that lets the encoder derive the width from the height
constexpr int AUTO_WIDTH = -2;

/// Audio bitrate for every audio rendition, in kbps
constexpr int AUDIO_BITRATE_KBPS = 128;

// **----- PROBED METADATA -----**

enum class TrackType { Video, Audio, Subtitle, Other };

/// Lower-case name used in directory names and log messages
const char *track_type_name(TrackType type);

/**
 * @struct Stream
 * @brief One stream of the probed container.
 * @note Optional fields are empty when the prober did not report them.
 */
struct Stream {
  TrackType type = TrackType::Other;
  std::string codec_type;              //< Raw codec_type from the prober
  std::optional<int> width;            //< Native width (video only)
  std::optional<int> height;           //< Native height (video only)
  std::optional<std::string> language; //< tags.language
  std::optional<std::string> title;    //< tags.title
  bool is_default = false;             //< disposition.default == 1
};

/**
 * @struct SourceContainer
 * @brief Immutable snapshot of a probed input file.
 */
struct SourceContainer {
  std::filesystem::path path;
  std::optional<double> duration; //< Seconds, empty if unknown
  std::vector<Stream> streams;
};

/**
 * @struct Track
 * @brief A supported stream paired with its type-scoped index.
 */
struct Track {
  TrackType type;
  int index;            //< Dense 0-based index within its type
  const Stream *stream; //< Owned by the SourceContainer
};

/**
 * @struct TrackLists
 * @brief Output of track classification, one ordered list per type.
 */
struct TrackLists {
  std::vector<Track> video;
  std::vector<Track> audio;
  std::vector<Track> subtitle;
  int skipped = 0; //< Streams of unsupported type
};

// **----- ENCODE PLAN -----**

/**
 * @struct RenditionSpec
 * @brief One rung of the video ladder.
 */
struct RenditionSpec {
  int height;       //< Target height in pixels
  int width;        //< Even width, or AUTO_WIDTH
  int bitrate_kbps; //< Target video bitrate
};

/**
 * @struct Job
 * @brief One external encoder invocation.
 * @note Created by the job builder, consumed once by the converter.
 */
struct Job {
  TrackType type = TrackType::Other;
  int track_index = 0;
  std::optional<RenditionSpec> rendition; //< Video jobs only
  std::filesystem::path output_dir;       //< <root>/<type>_<idx>
  std::filesystem::path output_file;      //< Playlist, or .vtt for subtitles
  std::filesystem::path playlist_file;    //< Manifest referenced by master
  std::vector<std::string> args;          //< Full argv, args[0] = encoder
  std::string description;                //< Progress task label
  double progress_total = PLACEHOLDER_DURATION_SEC;
};

// **----- RESULTS -----**

struct VideoResult {
  std::string uri; //< Relative to the output root, '/' separated
  int width;
  int height;
  long bandwidth; //< Bits per second
};

struct AudioResult {
  std::string uri;
  std::string name;
  std::string language;
  bool is_default;
};

struct SubtitleResult {
  std::string uri;
  std::string name;
  std::string language;
};

/**
 * @struct MasterPlaylist
 * @brief Successful renditions in discovery order, grouped by type.
 */
struct MasterPlaylist {
  std::vector<AudioResult> audio;
  std::vector<SubtitleResult> subtitles;
  std::vector<VideoResult> video;

  size_t size() const {
    return audio.size() + subtitles.size() + video.size();
  }
};

// **----- ERRORS -----**

/**
 * @brief Failure classes, used for logging and per-file reports.
 * @note Only the converter decides whether a failure is file-fatal.
 */
enum class ErrorKind {
  ToolUnavailable,
  ProbeFailure,
  RenditionFailure,
  ManifestWriteFailure,
  CleanupFailure
};

const char *error_kind_name(ErrorKind kind);

} // namespace hls_pack

#endif // HLS_PACK_TYPES_HPP
