/**
 * @file cleanup.cpp
 * @brief Intermediate file removal
 */

#include "hls_pack/cleanup.hpp"

#include <algorithm>
#include <string>
#include <system_error>

#include "hls_pack/system.hpp"

namespace hls_pack {

namespace fs = std::filesystem;

std::vector<fs::path> collect_cleanup_targets(const fs::path &source,
                                              const fs::path &root,
                                              const MasterPlaylist &master,
                                              Logger &log) {
  std::vector<fs::path> targets{source};

  std::vector<std::string> uris;
  for (const auto &v : master.video)
    uris.push_back(v.uri);
  for (const auto &a : master.audio)
    uris.push_back(a.uri);
  for (const auto &s : master.subtitles)
    uris.push_back(s.uri);

  for (const auto &uri : uris) {
    std::string ext = to_lower(fs::path(uri).extension().string());
    if (ext == ".m3u8" || ext == ".vtt")
      continue;

    fs::path segment_dir = (root / uri).parent_path();
    std::error_code ec;
    fs::directory_iterator it(segment_dir, ec);
    if (ec) {
      log.warn("Segment directory not found: {}", segment_dir.string());
      continue;
    }
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      const fs::path &file = it->path();
      if (file.extension() == ".ts" &&
          std::find(targets.begin(), targets.end(), file) == targets.end()) {
        targets.push_back(file);
      }
    }
  }
  return targets;
}

size_t remove_paths(const std::vector<fs::path> &paths, Logger &log) {
  size_t removed = 0;
  for (const auto &p : paths) {
    std::error_code ec;
    if (fs::remove(p, ec)) {
      ++removed;
      log.info("Removed file: {}", p.string());
    } else if (ec) {
      log.error("Error removing {}: {}", p.string(), ec.message());
    } else {
      log.warn("Nothing to remove at {}", p.string());
    }
  }
  return removed;
}

} // namespace hls_pack
