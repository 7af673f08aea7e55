/**
 * @file prober.cpp
 * @brief Prober invocation and report parsing
 */

#include "hls_pack/prober.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

#include "hls_pack/subprocess.hpp"
#include "hls_pack/track_classifier.hpp"

namespace hls_pack {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

/// Numeric field that ffprobe may print as a number or a string
std::optional<double> number_field(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end())
    return std::nullopt;
  if (it->is_number())
    return it->get<double>();
  if (it->is_string()) {
    try {
      size_t used = 0;
      const auto &text = it->get_ref<const std::string &>();
      double value = std::stod(text, &used);
      if (used == text.size())
        return value;
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<std::string> string_field(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return std::nullopt;
  return it->get<std::string>();
}

/// Positive pixel dimension, empty if absent, zero or out of int range
std::optional<int> dimension_field(const json &obj, const char *key) {
  auto value = number_field(obj, key);
  if (!value || !std::isfinite(*value) || *value < 1 ||
      *value > static_cast<double>(std::numeric_limits<int>::max()))
    return std::nullopt;
  return static_cast<int>(*value);
}

Stream stream_from_probe(const json &entry) {
  Stream s;
  if (auto codec_type = string_field(entry, "codec_type"))
    s.codec_type = *codec_type;
  s.type = track_type_from_codec(s.codec_type);

  if (s.type == TrackType::Video) {
    s.width = dimension_field(entry, "width");
    s.height = dimension_field(entry, "height");
  }

  auto tags = entry.find("tags");
  if (tags != entry.end() && tags->is_object()) {
    s.language = string_field(*tags, "language");
    s.title = string_field(*tags, "title");
  }

  auto disposition = entry.find("disposition");
  if (disposition != entry.end() && disposition->is_object()) {
    auto flag = number_field(*disposition, "default");
    s.is_default = flag && *flag == 1;
  }
  return s;
}

} // anonymous namespace

std::optional<json> probe_media(const std::string &ffprobe,
                                const fs::path &input, Logger &log) {
  std::vector<std::string> argv = {ffprobe,         "-v",
                                   "error",         "-print_format",
                                   "json",          "-show_format",
                                   "-show_streams", "-i",
                                   input.string()};
  std::string out, err;
  int status = run_capture(argv, out, err);
  if (status != 0) {
    log.error("Prober failed for {} (status {}): {}", input.string(), status,
              err);
    return std::nullopt;
  }

  json report = json::parse(out, nullptr, false);
  if (report.is_discarded() || !report.is_object()) {
    log.error("Prober returned invalid JSON for {}", input.string());
    return std::nullopt;
  }
  return report;
}

bool write_probe_snapshot(const json &report, const fs::path &output_dir,
                          Logger &log) {
  fs::path target = output_dir / PROBE_SNAPSHOT_NAME;
  std::ofstream f(target, std::ios::binary | std::ios::trunc);
  if (!f) {
    log.error("Cannot open {} for writing", target.string());
    return false;
  }
  f << report.dump(4, ' ', true, json::error_handler_t::replace) << '\n';
  if (!f.good()) {
    log.error("Failed writing {}", target.string());
    return false;
  }
  log.info("Generated {} for {}", PROBE_SNAPSHOT_NAME, output_dir.string());
  return true;
}

SourceContainer container_from_probe(const json &report,
                                     const fs::path &input) {
  SourceContainer source;
  source.path = input;

  auto format = report.find("format");
  if (format != report.end() && format->is_object()) {
    auto duration = number_field(*format, "duration");
    if (duration && std::isfinite(*duration) && *duration > 0)
      source.duration = duration;
  }

  auto streams = report.find("streams");
  if (streams != report.end() && streams->is_array()) {
    for (const auto &entry : *streams) {
      if (entry.is_object())
        source.streams.push_back(stream_from_probe(entry));
    }
  }
  return source;
}

} // namespace hls_pack
