#include <gtest/gtest.h>

#include "FakeTools.hpp"
#include "hls_pack/tool_check.hpp"

namespace hls_pack::tests {

TEST(ToolCheck, verifyTools) {
  TempDir dir;
  Logger log("", false);
  auto ok = write_script(dir.path() / "ffmpeg", "echo 'ffmpeg version 6.1'\n");
  auto broken = write_script(dir.path() / "ffprobe", "exit 1\n");
  auto missing = dir.path() / "not_installed";

  EXPECT_TRUE(verify_tools(ok.string(), ok.string(), log));
  EXPECT_FALSE(verify_tools(ok.string(), broken.string(), log));
  EXPECT_FALSE(verify_tools(missing.string(), ok.string(), log));
}

TEST(ToolCheck, detectHardwareEncoder) {
  TempDir dir;
  Logger log("", false);
  auto with_nvenc = write_script(
      dir.path() / "ffmpeg_nvenc",
      "echo ' DEV.LS h264  H.264 / AVC (encoders: libx264 h264_nvenc )'\n");
  auto software_only = write_script(
      dir.path() / "ffmpeg_sw",
      "echo ' DEV.LS h264  H.264 / AVC (encoders: libx264 )'\n");
  auto failing = write_script(dir.path() / "ffmpeg_fail",
                              "echo 'h264_nvenc'\nexit 1\n");

  EXPECT_TRUE(detect_hardware_encoder(with_nvenc.string(), log));
  EXPECT_FALSE(detect_hardware_encoder(software_only.string(), log));
  EXPECT_FALSE(detect_hardware_encoder(failing.string(), log));
}

} // namespace hls_pack::tests
