/**
 * @file job_builder.hpp
 * @brief Construction of external encoder invocations
 *
 * @details One Job per video ladder rung, per audio track and per subtitle
 *          track. Each job writes into its own directory under the output
 *          root, named <type>_<index>, so no two jobs share a path:
 *
 *          - video_N/<h>p.m3u8 + video_N/segment_<h>p_%03d.ts
 *
 *          - audio_N/audio.m3u8 + audio_N/segment_audio_%03d.ts
 *
 *          - subtitle_N/subtitle.vtt (+ subtitle.m3u8 written afterwards)
 */

#ifndef HLS_PACK_JOB_BUILDER_HPP
#define HLS_PACK_JOB_BUILDER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace hls_pack {

/**
 * @struct EncoderOptions
 * @brief Encoder settings shared by every job of a run.
 */
struct EncoderOptions {
  std::string ffmpeg = "ffmpeg"; //< Encoder binary
  bool hardware = false;         //< Use h264_nvenc instead of libx264
};

/// Software and hardware H.264 encoder names
constexpr const char *SOFTWARE_VIDEO_CODEC = "libx264";
constexpr const char *HARDWARE_VIDEO_CODEC = "h264_nvenc";

/// Directory of a track below the output root, e.g. "audio_1"
std::filesystem::path track_directory(const std::filesystem::path &root,
                                      TrackType type, int index);

/// Progress total for a source: its duration, or the placeholder
double progress_total_for(std::optional<double> duration);

/**
 * @brief Build the job encoding one ladder rung of a video track.
 * @param input Source file
 * @param root Output root of the source
 * @param index Type-scoped video track index
 * @param rung Target rendition
 * @param duration Source duration, if known
 * @param options Encoder settings
 */
Job build_video_job(const std::filesystem::path &input,
                    const std::filesystem::path &root, int index,
                    const RenditionSpec &rung,
                    std::optional<double> duration,
                    const EncoderOptions &options);

/// Build the job encoding one audio track to AAC HLS
Job build_audio_job(const std::filesystem::path &input,
                    const std::filesystem::path &root, int index,
                    std::optional<double> duration,
                    const EncoderOptions &options);

/// Build the job extracting one subtitle track to WebVTT
Job build_subtitle_job(const std::filesystem::path &input,
                       const std::filesystem::path &root, int index,
                       std::optional<double> duration,
                       const EncoderOptions &options);

} // namespace hls_pack

#endif // HLS_PACK_JOB_BUILDER_HPP
