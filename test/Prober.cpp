#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "FakeTools.hpp"
#include "hls_pack/prober.hpp"

namespace hls_pack::tests {

using json = nlohmann::json;

namespace {

constexpr const char *PROBE_REPORT = R"({
  "streams": [
    {"index": 0, "codec_type": "video", "width": 1920, "height": 1080,
     "disposition": {"default": 1}},
    {"index": 1, "codec_type": "audio",
     "tags": {"language": "por", "title": "Olá"},
     "disposition": {"default": 1}},
    {"index": 2, "codec_type": "audio", "tags": {"language": "eng"},
     "disposition": {"default": 0}},
    {"index": 3, "codec_type": "subtitle", "tags": {"language": "spa"}},
    {"index": 4, "codec_type": "attachment"}
  ],
  "format": {"filename": "movie.mkv", "duration": "120.500000"}
})";

} // namespace

TEST(Prober, containerFromProbe) {
  SourceContainer source =
      container_from_probe(json::parse(PROBE_REPORT), "movie.mkv");

  EXPECT_EQ(source.path.string(), "movie.mkv");
  ASSERT_TRUE(source.duration);
  EXPECT_DOUBLE_EQ(*source.duration, 120.5);
  ASSERT_EQ(source.streams.size(), 5u);

  const Stream &video = source.streams[0];
  EXPECT_EQ(video.type, TrackType::Video);
  EXPECT_EQ(video.width, 1920);
  EXPECT_EQ(video.height, 1080);

  const Stream &audio = source.streams[1];
  EXPECT_EQ(audio.type, TrackType::Audio);
  EXPECT_EQ(audio.language, "por");
  EXPECT_EQ(audio.title, "Olá");
  EXPECT_TRUE(audio.is_default);
  EXPECT_FALSE(audio.width);

  EXPECT_FALSE(source.streams[2].is_default);
  EXPECT_FALSE(source.streams[2].title);
  EXPECT_FALSE(source.streams[3].is_default);
  EXPECT_EQ(source.streams[4].type, TrackType::Other);
  EXPECT_EQ(source.streams[4].codec_type, "attachment");
}

TEST(Prober, missingOrMalformedFields) {
  json report = json::parse(R"({
    "streams": [
      {"codec_type": "video", "width": 0, "height": "720"},
      {"codec_type": "video"},
      {"width": 640},
      "not an object"
    ],
    "format": {"duration": "N/A"}
  })");

  SourceContainer source = container_from_probe(report, "x.mkv");
  EXPECT_FALSE(source.duration);
  ASSERT_EQ(source.streams.size(), 3u);
  EXPECT_FALSE(source.streams[0].width);
  EXPECT_EQ(source.streams[0].height, 720);
  EXPECT_FALSE(source.streams[1].height);
  EXPECT_EQ(source.streams[2].type, TrackType::Other);

  EXPECT_TRUE(container_from_probe(json::object(), "y.mkv").streams.empty());
}

TEST(Prober, outOfRangeValuesAreUnknown) {
  json report = json::parse(R"({
    "streams": [
      {"codec_type": "video", "width": 1e12, "height": "99999999999"},
      {"codec_type": "video", "width": "inf", "height": "nan"},
      {"codec_type": "video", "width": 2147483647, "height": 1080}
    ],
    "format": {"duration": "inf"}
  })");

  SourceContainer source = container_from_probe(report, "x.mkv");
  EXPECT_FALSE(source.duration);
  ASSERT_EQ(source.streams.size(), 3u);
  EXPECT_FALSE(source.streams[0].width);
  EXPECT_FALSE(source.streams[0].height);
  EXPECT_FALSE(source.streams[1].width);
  EXPECT_FALSE(source.streams[1].height);
  EXPECT_EQ(source.streams[2].width, 2147483647);
  EXPECT_EQ(source.streams[2].height, 1080);

  report["format"]["duration"] = "nan";
  EXPECT_FALSE(container_from_probe(report, "x.mkv").duration);
}

TEST(Prober, runsProberAndWritesAsciiSnapshot) {
  TempDir dir;
  Logger log("", false);
  auto ffprobe = write_fake_prober(dir.path(), PROBE_REPORT);

  auto report = probe_media(ffprobe.string(), dir.path() / "movie.mkv", log);
  ASSERT_TRUE(report);
  EXPECT_EQ((*report)["format"]["duration"], "120.500000");

  ASSERT_TRUE(write_probe_snapshot(*report, dir.path(), log));
  std::string snapshot = read_file(dir.path() / PROBE_SNAPSHOT_NAME);
  EXPECT_NE(snapshot.find("\\u00e1"), std::string::npos);
  EXPECT_NE(snapshot.find("\n    \"format\""), std::string::npos);
  for (char c : snapshot)
    EXPECT_EQ(static_cast<unsigned char>(c) & 0x80, 0);

  EXPECT_EQ(json::parse(snapshot), *report);
}

TEST(Prober, failures) {
  TempDir dir;
  Logger log("", false);

  auto failing = write_script(dir.path() / "ffprobe_fail",
                              "echo 'movie.mkv: Invalid data' >&2\nexit 1\n");
  EXPECT_FALSE(probe_media(failing.string(), "movie.mkv", log));

  auto garbage = write_script(dir.path() / "ffprobe_garbage", "echo '{oops'\n");
  EXPECT_FALSE(probe_media(garbage.string(), "movie.mkv", log));

  EXPECT_FALSE(probe_media((dir.path() / "missing").string(), "movie.mkv", log));
}

TEST(Prober, snapshotToMissingDirectory) {
  TempDir dir;
  Logger log("", false);
  EXPECT_FALSE(write_probe_snapshot(json::object(),
                                    dir.path() / "does" / "not" / "exist", log));
}

} // namespace hls_pack::tests
