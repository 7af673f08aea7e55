#include <algorithm>

#include <gtest/gtest.h>

#include "hls_pack/job_builder.hpp"

namespace hls_pack::tests {

namespace {

using Args = std::vector<std::string>;

} // namespace

TEST(JobBuilder, softwareVideoJob) {
  EncoderOptions options;
  RenditionSpec rung{720, 1280, 2500};
  Job job = build_video_job("/in/movie.mkv", "/out/movie", 0, rung, 120.0,
                            options);

  EXPECT_EQ(job.type, TrackType::Video);
  EXPECT_EQ(job.output_dir.string(), "/out/movie/video_0");
  EXPECT_EQ(job.playlist_file.string(), "/out/movie/video_0/720p.m3u8");
  EXPECT_EQ(job.output_file.string(), job.playlist_file.string());
  EXPECT_EQ(job.description, "video 0 @ 720p");
  EXPECT_DOUBLE_EQ(job.progress_total, 120.0);
  ASSERT_TRUE(job.rendition);
  EXPECT_EQ(job.rendition->bitrate_kbps, 2500);

  const Args expected{"ffmpeg",
                      "-y",
                      "-nostdin",
                      "-i",
                      "/in/movie.mkv",
                      "-map",
                      "0:v:0",
                      "-c:v",
                      "libx264",
                      "-preset",
                      "fast",
                      "-b:v",
                      "2500k",
                      "-vf",
                      "scale=1280:720",
                      "-pix_fmt",
                      "yuv420p",
                      "-f",
                      "hls",
                      "-hls_time",
                      "10",
                      "-hls_playlist_type",
                      "vod",
                      "-hls_segment_filename",
                      "/out/movie/video_0/segment_720p_%03d.ts",
                      "/out/movie/video_0/720p.m3u8"};
  EXPECT_EQ(job.args, expected);
}

TEST(JobBuilder, hardwareVideoJob) {
  EncoderOptions options;
  options.ffmpeg = "/usr/local/bin/ffmpeg";
  options.hardware = true;
  Job job = build_video_job("in.mkv", "out", 1, {360, AUTO_WIDTH, 800},
                            std::nullopt, options);

  EXPECT_EQ(job.args.front(), "/usr/local/bin/ffmpeg");
  EXPECT_DOUBLE_EQ(job.progress_total, PLACEHOLDER_DURATION_SEC);

  const Args rate_control{"-c:v",    "h264_nvenc", "-preset", "fast",
                          "-rc:v",   "vbr_hq",     "-b:v",    "800k",
                          "-maxrate", "800k",      "-bufsize", "1600k",
                          "-vf",     "scale=-2:360"};
  auto it = std::search(job.args.begin(), job.args.end(), rate_control.begin(),
                        rate_control.end());
  EXPECT_TRUE(it != job.args.end());
  EXPECT_TRUE(std::find(job.args.begin(), job.args.end(), "0:v:1") !=
              job.args.end());
}

TEST(JobBuilder, audioJob) {
  Job job = build_audio_job("in.mkv", "out", 2, 60.0, EncoderOptions{});

  EXPECT_EQ(job.type, TrackType::Audio);
  EXPECT_FALSE(job.rendition);
  EXPECT_EQ(job.output_dir.string(), "out/audio_2");
  EXPECT_EQ(job.playlist_file.string(), "out/audio_2/audio.m3u8");
  EXPECT_EQ(job.description, "audio 2");

  const Args expected{"ffmpeg",
                      "-y",
                      "-nostdin",
                      "-i",
                      "in.mkv",
                      "-map",
                      "0:a:2",
                      "-c:a",
                      "aac",
                      "-b:a",
                      "128k",
                      "-f",
                      "hls",
                      "-hls_time",
                      "10",
                      "-hls_playlist_type",
                      "vod",
                      "-hls_segment_filename",
                      "out/audio_2/segment_audio_%03d.ts",
                      "out/audio_2/audio.m3u8"};
  EXPECT_EQ(job.args, expected);
}

TEST(JobBuilder, subtitleJob) {
  Job job = build_subtitle_job("in.mkv", "out", 0, 60.0, EncoderOptions{});

  EXPECT_EQ(job.type, TrackType::Subtitle);
  EXPECT_EQ(job.output_file.string(), "out/subtitle_0/subtitle.vtt");
  EXPECT_EQ(job.playlist_file.string(), "out/subtitle_0/subtitle.m3u8");
  EXPECT_EQ(job.description, "subtitle 0");

  const Args expected{"ffmpeg", "-y",     "-nostdin", "-i",     "in.mkv",
                      "-map",   "0:s:0",  "-c:s",     "webvtt", "-f",
                      "webvtt", "out/subtitle_0/subtitle.vtt"};
  EXPECT_EQ(job.args, expected);
}

TEST(JobBuilder, progressTotal) {
  EXPECT_DOUBLE_EQ(progress_total_for(42.5), 42.5);
  EXPECT_DOUBLE_EQ(progress_total_for(0.0), PLACEHOLDER_DURATION_SEC);
  EXPECT_DOUBLE_EQ(progress_total_for(std::nullopt), PLACEHOLDER_DURATION_SEC);
}

} // namespace hls_pack::tests
