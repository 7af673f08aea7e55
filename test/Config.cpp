#include <cstdlib>

#include <gtest/gtest.h>

#include "hls_pack/config.hpp"

namespace hls_pack::tests {

TEST(Config, parseRungList) {
  struct TestCase {
    std::string text;
    std::vector<int> expected;
  } testCases[]{
      {"240,360,480", {240, 360, 480}},
      {"720, 240 ,480", {240, 480, 720}},
      {"480,480,240", {240, 480}},
      {"720p,480", {480}},
      {"-1,0,360", {360}},
      {"abc", {}},
      {"", {}},
  };

  for (const TestCase &testCase : testCases) {
    EXPECT_EQ(Config::parse_rung_list(testCase.text), testCase.expected)
        << " text was '" << testCase.text << "'";
  }
}

TEST(Config, envInt) {
  ::unsetenv("HLS_PACK_TEST_INT");
  EXPECT_EQ(Config::get_env_int("HLS_PACK_TEST_INT", 7), 7);

  ::setenv("HLS_PACK_TEST_INT", "3", 1);
  EXPECT_EQ(Config::get_env_int("HLS_PACK_TEST_INT", 7), 3);

  ::setenv("HLS_PACK_TEST_INT", "many", 1);
  EXPECT_EQ(Config::get_env_int("HLS_PACK_TEST_INT", 7), 7);
  ::unsetenv("HLS_PACK_TEST_INT");
}

TEST(Config, envString) {
  ::setenv("HLS_PACK_TEST_STRING", "/opt/ffmpeg/bin/ffmpeg", 1);
  EXPECT_EQ(Config::get_env_string("HLS_PACK_TEST_STRING", "ffmpeg"),
            "/opt/ffmpeg/bin/ffmpeg");
  ::unsetenv("HLS_PACK_TEST_STRING");
  EXPECT_EQ(Config::get_env_string("HLS_PACK_TEST_STRING", "ffmpeg"),
            "ffmpeg");
}

} // namespace hls_pack::tests
