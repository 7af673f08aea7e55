/**
 * @file prober.hpp
 * @brief Container probing via the external prober
 *
 * @details Provides:
 *
 *          - probe_media(): run ffprobe and parse its JSON report
 *
 *          - write_probe_snapshot(): persist the report as info.json
 *
 *          - container_from_probe(): typed SourceContainer from the report
 */

#ifndef HLS_PACK_PROBER_HPP
#define HLS_PACK_PROBER_HPP

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "types.hpp"

namespace hls_pack {

/// Name of the probe snapshot written into every output root
constexpr const char *PROBE_SNAPSHOT_NAME = "info.json";

/**
 * @brief Run the prober on a file.
 *
 * @param ffprobe Prober binary
 * @param input Media file to probe
 * @param log Logger for failures
 * @return Parsed report, or empty if the prober failed or printed something
 *         that is not a JSON object
 */
std::optional<nlohmann::json> probe_media(const std::string &ffprobe,
                                          const std::filesystem::path &input,
                                          Logger &log);

/**
 * @brief Write the report to <output_dir>/info.json.
 * @note Pretty-printed with 4-space indentation, non-ASCII escaped.
 * @return true on success
 */
bool write_probe_snapshot(const nlohmann::json &report,
                          const std::filesystem::path &output_dir,
                          Logger &log);

/**
 * @brief Build the typed container description from a probe report.
 * @note Missing or malformed fields become empty optionals; this never
 *       fails.
 */
SourceContainer container_from_probe(const nlohmann::json &report,
                                     const std::filesystem::path &input);

} // namespace hls_pack

#endif // HLS_PACK_PROBER_HPP
