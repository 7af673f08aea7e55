#include "FakeTools.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace hls_pack::tests {

namespace fs = std::filesystem;

TempDir::TempDir() {
  std::string pattern =
      (fs::temp_directory_path() / "hls_pack_test_XXXXXX").string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (!::mkdtemp(buf.data()))
    throw std::runtime_error("mkdtemp failed for " + pattern);
  path_ = buf.data();
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

fs::path write_script(const fs::path &path, const std::string &body) {
  write_file(path, "#!/bin/sh\n" + body);
  fs::permissions(path,
                  fs::perms::owner_all | fs::perms::group_read |
                      fs::perms::group_exec | fs::perms::others_read |
                      fs::perms::others_exec,
                  fs::perm_options::replace);
  return path;
}

void write_file(const fs::path &path, const std::string &content) {
  if (path.has_parent_path())
    fs::create_directories(path.parent_path());
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  f << content;
}

std::string read_file(const fs::path &path) {
  std::ifstream f(path, std::ios::binary);
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

fs::path write_fake_prober(const fs::path &dir, const std::string &report) {
  write_file(dir / "probe.json", report);
  return write_script(dir / "ffprobe",
                      "cat '" + (dir / "probe.json").string() + "'\n");
}

fs::path write_fake_encoder(const fs::path &dir,
                            const std::string &fail_pattern) {
  std::string body;
  body += "for last; do :; done\n";
  if (!fail_pattern.empty()) {
    body += "case \"$*\" in *" + fail_pattern +
            "*) echo 'Conversion failed!' >&2; exit 1;; esac\n";
  }
  body += "printf 'frame=1 time=00:00:30.00 bitrate=N/A\\r' >&2\n";
  body += "printf 'frame=2 time=N/A bitrate=N/A\\r' >&2\n";
  body += "printf 'frame=3 time=00:01:00.50 bitrate=N/A\\n' >&2\n";
  body += "out_dir=$(dirname \"$last\")\n";
  body += "mkdir -p \"$out_dir\"\n";
  body += ": > \"$last\"\n";
  body += ": > \"$out_dir/segment_$(basename \"$last\" | tr . _)_000.ts\"\n";
  body += "exit 0\n";
  return write_script(dir / "ffmpeg", body);
}

} // namespace hls_pack::tests
