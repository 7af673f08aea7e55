/**
 * @file track_classifier.cpp
 * @brief Track classification implementation
 */

#include "hls_pack/track_classifier.hpp"

#include <fmt/core.h>

namespace hls_pack {

TrackType track_type_from_codec(const std::string &codec_type) {
  if (codec_type == "video")
    return TrackType::Video;
  if (codec_type == "audio")
    return TrackType::Audio;
  if (codec_type == "subtitle")
    return TrackType::Subtitle;
  return TrackType::Other;
}

TrackLists classify_tracks(const SourceContainer &source, Logger &log) {
  TrackLists lists;

  for (const auto &stream : source.streams) {
    switch (stream.type) {
    case TrackType::Video:
      lists.video.push_back(
          {stream.type, static_cast<int>(lists.video.size()), &stream});
      break;
    case TrackType::Audio:
      lists.audio.push_back(
          {stream.type, static_cast<int>(lists.audio.size()), &stream});
      break;
    case TrackType::Subtitle:
      lists.subtitle.push_back(
          {stream.type, static_cast<int>(lists.subtitle.size()), &stream});
      break;
    case TrackType::Other:
      ++lists.skipped;
      log.warn("Track of type '{}' is not supported. Skipping.",
               stream.codec_type.empty() ? "unknown" : stream.codec_type);
      break;
    }
  }

  log.debug("Classified {}: {} video, {} audio, {} subtitle, {} skipped",
            source.path.filename().string(), lists.video.size(),
            lists.audio.size(), lists.subtitle.size(), lists.skipped);
  return lists;
}

std::string display_name(const Track &track) {
  const Stream &s = *track.stream;
  if (s.title && !s.title->empty())
    return *s.title;
  if (s.language && !s.language->empty())
    return *s.language;

  std::string type = track_type_name(track.type);
  type[0] = static_cast<char>(type[0] - 'a' + 'A');
  return fmt::format("{}_{}", type, track.index);
}

std::string language_code(const Track &track) {
  const Stream &s = *track.stream;
  if (s.language && !s.language->empty())
    return *s.language;
  return UNDEFINED_LANGUAGE;
}

} // namespace hls_pack
