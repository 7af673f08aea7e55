/**
 * @file types.cpp
 * @brief Names for core enumerations
 */

#include "hls_pack/types.hpp"

namespace hls_pack {

const char *track_type_name(TrackType type) {
  switch (type) {
  case TrackType::Video:
    return "video";
  case TrackType::Audio:
    return "audio";
  case TrackType::Subtitle:
    return "subtitle";
  case TrackType::Other:
    return "other";
  }
  return "other";
}

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ToolUnavailable:
    return "ToolUnavailable";
  case ErrorKind::ProbeFailure:
    return "ProbeFailure";
  case ErrorKind::RenditionFailure:
    return "RenditionFailure";
  case ErrorKind::ManifestWriteFailure:
    return "ManifestWriteFailure";
  case ErrorKind::CleanupFailure:
    return "CleanupFailure";
  }
  return "Unknown";
}

} // namespace hls_pack
