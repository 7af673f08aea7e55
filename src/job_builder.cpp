/**
 * @file job_builder.cpp
 * @brief Encoder invocation construction
 */

#include "hls_pack/job_builder.hpp"

#include <fmt/core.h>

namespace hls_pack {

namespace fs = std::filesystem;

namespace {

/// "<ffmpeg> -y -nostdin -i <input> -map 0:<sel>:<idx>"
std::vector<std::string> input_args(const EncoderOptions &options,
                                    const fs::path &input, char selector,
                                    int index) {
  return {options.ffmpeg, "-y",   "-nostdin",
          "-i",           input.string(), "-map",
          fmt::format("0:{}:{}", selector, index)};
}

/// Segmented VOD output with fixed segment duration
void append_hls_output(std::vector<std::string> &args,
                       const fs::path &segment_pattern,
                       const fs::path &playlist) {
  args.insert(args.end(),
              {"-f", "hls", "-hls_time", std::to_string(SEGMENT_DURATION_SEC),
               "-hls_playlist_type", "vod", "-hls_segment_filename",
               segment_pattern.string(), playlist.string()});
}

} // anonymous namespace

fs::path track_directory(const fs::path &root, TrackType type, int index) {
  return root / fmt::format("{}_{}", track_type_name(type), index);
}

double progress_total_for(std::optional<double> duration) {
  return (duration && *duration > 0) ? *duration : PLACEHOLDER_DURATION_SEC;
}

Job build_video_job(const fs::path &input, const fs::path &root, int index,
                    const RenditionSpec &rung, std::optional<double> duration,
                    const EncoderOptions &options) {
  Job job;
  job.type = TrackType::Video;
  job.track_index = index;
  job.rendition = rung;
  job.output_dir = track_directory(root, TrackType::Video, index);
  job.playlist_file = job.output_dir / fmt::format("{}p.m3u8", rung.height);
  job.output_file = job.playlist_file;
  job.description = fmt::format("video {} @ {}p", index, rung.height);
  job.progress_total = progress_total_for(duration);

  const std::string kbps = fmt::format("{}k", rung.bitrate_kbps);

  job.args = input_args(options, input, 'v', index);
  job.args.insert(job.args.end(),
                  {"-c:v",
                   options.hardware ? HARDWARE_VIDEO_CODEC
                                    : SOFTWARE_VIDEO_CODEC,
                   "-preset", "fast"});
  if (options.hardware) {
    job.args.insert(job.args.end(),
                    {"-rc:v", "vbr_hq", "-b:v", kbps, "-maxrate", kbps,
                     "-bufsize", fmt::format("{}k", rung.bitrate_kbps * 2)});
  } else {
    job.args.insert(job.args.end(), {"-b:v", kbps});
  }
  job.args.insert(job.args.end(),
                  {"-vf", fmt::format("scale={}:{}", rung.width, rung.height),
                   "-pix_fmt", "yuv420p"});
  append_hls_output(
      job.args,
      job.output_dir / fmt::format("segment_{}p_%03d.ts", rung.height),
      job.playlist_file);
  return job;
}

Job build_audio_job(const fs::path &input, const fs::path &root, int index,
                    std::optional<double> duration,
                    const EncoderOptions &options) {
  Job job;
  job.type = TrackType::Audio;
  job.track_index = index;
  job.output_dir = track_directory(root, TrackType::Audio, index);
  job.playlist_file = job.output_dir / "audio.m3u8";
  job.output_file = job.playlist_file;
  job.description = fmt::format("audio {}", index);
  job.progress_total = progress_total_for(duration);

  job.args = input_args(options, input, 'a', index);
  job.args.insert(job.args.end(),
                  {"-c:a", "aac", "-b:a",
                   fmt::format("{}k", AUDIO_BITRATE_KBPS)});
  append_hls_output(job.args, job.output_dir / "segment_audio_%03d.ts",
                    job.playlist_file);
  return job;
}

Job build_subtitle_job(const fs::path &input, const fs::path &root,
                       int index, std::optional<double> duration,
                       const EncoderOptions &options) {
  Job job;
  job.type = TrackType::Subtitle;
  job.track_index = index;
  job.output_dir = track_directory(root, TrackType::Subtitle, index);
  job.output_file = job.output_dir / "subtitle.vtt";
  job.playlist_file = job.output_dir / "subtitle.m3u8";
  job.description = fmt::format("subtitle {}", index);
  job.progress_total = progress_total_for(duration);

  job.args = input_args(options, input, 's', index);
  job.args.insert(job.args.end(), {"-c:s", "webvtt", "-f", "webvtt",
                                   job.output_file.string()});
  return job;
}

} // namespace hls_pack
