#include <gtest/gtest.h>

#include "FakeTools.hpp"
#include "hls_pack/subprocess.hpp"

namespace hls_pack::tests {

TEST(Subprocess, splitsDiagnosticsOnCarriageReturns) {
  TempDir dir;
  auto script = write_script(dir.path() / "tool",
                             "printf 'one\\rtwo\\n\\nthree' >&2\n"
                             "echo 'stdout is discarded'\n"
                             "exit 3\n");

  Subprocess process({script.string()});
  ASSERT_TRUE(process.start()) << process.error();

  std::vector<std::string> lines;
  std::string line;
  while (process.read_line(line))
    lines.push_back(line);

  EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
  EXPECT_EQ(process.wait(), 3);
}

TEST(Subprocess, waitWithoutReading) {
  TempDir dir;
  auto script = write_script(dir.path() / "tool",
                             "i=0\n"
                             "while [ $i -lt 2000 ]; do\n"
                             "  echo \"frame=$i time=00:00:01.00\" >&2\n"
                             "  i=$((i + 1))\n"
                             "done\n");

  Subprocess process({script.string()});
  ASSERT_TRUE(process.start());
  EXPECT_EQ(process.wait(), 0);
}

TEST(Subprocess, missingBinary) {
  TempDir dir;
  Subprocess process({(dir.path() / "no_such_tool").string(), "-version"});
  if (process.start()) {
    std::string line;
    while (process.read_line(line)) {
    }
    EXPECT_EQ(process.wait(), EXEC_FAILED_STATUS);
  } else {
    EXPECT_FALSE(process.error().empty());
  }
}

TEST(Subprocess, runCapture) {
  TempDir dir;
  auto script = write_script(dir.path() / "tool",
                             "echo \"args: $*\"\n"
                             "echo 'warning' >&2\n");

  std::string out, err;
  EXPECT_EQ(run_capture({script.string(), "-a", "b c"}, out, err), 0);
  EXPECT_EQ(out, "args: -a b c\n");
  EXPECT_EQ(err, "warning\n");

  EXPECT_NE(run_capture({(dir.path() / "missing").string()}, out, err), 0);
}

TEST(Subprocess, joinCommand) {
  EXPECT_EQ(join_command({"ffmpeg", "-y", "-i", "in.mkv"}),
            "ffmpeg -y -i in.mkv");
  EXPECT_EQ(join_command({}), "");
}

} // namespace hls_pack::tests
