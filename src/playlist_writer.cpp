/**
 * @file playlist_writer.cpp
 * @brief HLS manifest writer implementation
 */

#include "hls_pack/playlist_writer.hpp"

#include <fstream>

#include <fmt/core.h>

namespace hls_pack {

namespace fs = std::filesystem;

namespace {

/// HLS quoted-string values may not contain '"', CR or LF
std::string quoted(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 2);
  out += '"';
  for (char c : value) {
    if (c == '"')
      out += '\'';
    else if (c == '\r' || c == '\n')
      out += ' ';
    else
      out += c;
  }
  out += '"';
  return out;
}

bool write_text(const fs::path &target, const std::string &text) {
  std::ofstream f(target, std::ios::binary | std::ios::trunc);
  if (!f)
    return false;
  f << text;
  f.flush();
  return f.good();
}

} // anonymous namespace

std::string relative_uri(const fs::path &file, const fs::path &root) {
  return file.lexically_relative(root).generic_string();
}

std::string render_subtitle_playlist(const std::string &caption_file) {
  std::string out;
  out += "#EXTM3U\n#EXT-X-VERSION:3\n";
  out += fmt::format("#EXT-X-TARGETDURATION:{}\n", SEGMENT_DURATION_SEC);
  out += "#EXT-X-MEDIA-SEQUENCE:0\n";
  out += fmt::format("#EXTINF:{:.1f},\n",
                     static_cast<double>(SEGMENT_DURATION_SEC));
  out += caption_file + "\n";
  out += "#EXT-X-ENDLIST\n";
  return out;
}

bool write_subtitle_playlist(const fs::path &playlist,
                             const std::string &caption_file, Logger &log) {
  if (!write_text(playlist, render_subtitle_playlist(caption_file))) {
    log.error("Failed to write subtitle playlist {}", playlist.string());
    return false;
  }
  log.info("Subtitle playlist created at {}", playlist.string());
  return true;
}

std::string render_master_playlist(const MasterPlaylist &master) {
  std::string out = "#EXTM3U\n#EXT-X-VERSION:3\n\n";

  for (const auto &a : master.audio) {
    out += fmt::format("#EXT-X-MEDIA:TYPE=AUDIO,GROUP-ID={},NAME={},"
                       "LANGUAGE={},DEFAULT={},AUTOSELECT=YES,URI={}\n",
                       quoted(AUDIO_GROUP_ID), quoted(a.name),
                       quoted(a.language), a.is_default ? "YES" : "NO",
                       quoted(a.uri));
  }
  for (const auto &s : master.subtitles) {
    out += fmt::format("#EXT-X-MEDIA:TYPE=SUBTITLES,GROUP-ID={},NAME={},"
                       "LANGUAGE={},DEFAULT=NO,AUTOSELECT=YES,URI={}\n",
                       quoted(SUBTITLE_GROUP_ID), quoted(s.name),
                       quoted(s.language), quoted(s.uri));
  }
  out += "\n";

  for (const auto &v : master.video) {
    std::string attrs = fmt::format("BANDWIDTH={}", v.bandwidth);
    if (v.width != AUTO_WIDTH && v.width > 0)
      attrs += fmt::format(",RESOLUTION={}x{}", v.width, v.height);
    if (!master.audio.empty())
      attrs += fmt::format(",AUDIO={}", quoted(AUDIO_GROUP_ID));
    if (!master.subtitles.empty())
      attrs += fmt::format(",SUBTITLES={}", quoted(SUBTITLE_GROUP_ID));
    out += fmt::format("#EXT-X-STREAM-INF:{}\n{}\n", attrs, v.uri);
  }
  return out;
}

bool write_master_playlist(const fs::path &root, const MasterPlaylist &master,
                           Logger &log) {
  fs::path target = root / MASTER_PLAYLIST_NAME;
  if (!write_text(target, render_master_playlist(master))) {
    log.error("Failed to create {}", target.string());
    return false;
  }
  log.success("Master playlist created at {}", target.string());
  return true;
}

} // namespace hls_pack
