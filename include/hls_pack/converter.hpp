/**
 * @file converter.hpp
 * @brief Per-file conversion orchestration
 *
 * @details The FileConverter class turns one container into an HLS package:
 *
 *          1. Probe the container and write info.json
 *
 *          2. Classify its streams into video, audio and subtitle tracks
 *
 *          3. Build one job per video rung, audio track and subtitle track
 *
 *          4. Run the jobs on a bounded worker pool
 *
 *          5. Write master.m3u8 from the renditions that succeeded
 *
 *          6. Optionally remove intermediate files
 *
 * @note Only a probe failure aborts the file. A failed job drops its one
 *       rendition and the remaining jobs still run.
 */

#ifndef HLS_PACK_CONVERTER_HPP
#define HLS_PACK_CONVERTER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "job_builder.hpp"
#include "ladder.hpp"
#include "logging.hpp"
#include "progress.hpp"
#include "types.hpp"

namespace hls_pack {

/**
 * @struct ConverterOptions
 * @brief Settings for every file of a batch.
 */
struct ConverterOptions {
  EncoderOptions encoder;
  std::string ffprobe = "ffprobe";
  std::vector<int> ladder{DEFAULT_RUNGS.begin(), DEFAULT_RUNGS.end()};
  bool delete_intermediates = false;
  int parallel_jobs = 1; //< Encoder processes in flight, >= 1
};

enum class FileState {
  Probing,
  Classifying,
  PerTrackProcessing,
  Assembling,
  Cleanup,
  Done,
  Failed
};

const char *file_state_name(FileState state);

/**
 * @struct FileReport
 * @brief Outcome of converting one file.
 */
struct FileReport {
  std::filesystem::path input;
  std::filesystem::path output_root;
  FileState state = FileState::Probing; //< Done or Failed once finished
  std::optional<ErrorKind> failure;     //< Set when state == Failed
  MasterPlaylist master;                //< Successful renditions
  size_t jobs_total = 0;
  size_t jobs_failed = 0;
  bool master_written = false;
  size_t files_removed = 0;
  long processing_time_us = 0;

  bool success() const { return state == FileState::Done; }
};

/**
 * @struct PlannedJob
 * @brief A job plus the track it encodes.
 */
struct PlannedJob {
  Job job;
  Track track;
};

/**
 * @class FileConverter
 * @brief Converts one input file at a time.
 */
class FileConverter {
public:
  FileConverter(ConverterOptions options, ProgressRegistry &registry,
                Logger &log);

  /**
   * @brief Convert one container into <dir>/<sanitized stem>/.
   * @return Report; never throws for tool or I/O failures
   */
  FileReport convert(const std::filesystem::path &input);

  /**
   * @brief Output root for an input file.
   * @note The sanitized base name next to the input; "media" if nothing of
   *       the name survives sanitization.
   */
  static std::filesystem::path
  output_root_for(const std::filesystem::path &input);

  /**
   * @brief Build every job for a classified container.
   * @note Order: video tracks (each rung ascending), then audio tracks,
   *       then subtitle tracks.
   */
  std::vector<PlannedJob> plan_jobs(const SourceContainer &source,
                                    const TrackLists &tracks,
                                    const std::filesystem::path &root) const;

private:
  ConverterOptions options_;
  ProgressRegistry &registry_;
  Logger &log_;

  /// Run one job to completion; true if its rendition is usable
  bool execute(const Job &job);

  /// Run all jobs on the worker pool; element i is 1 if job i succeeded
  std::vector<char> run_jobs(const std::vector<PlannedJob> &jobs);

  /// Add a successful job's rendition to the master playlist
  void add_result(const PlannedJob &planned,
                  const std::filesystem::path &root,
                  MasterPlaylist &master) const;
};

} // namespace hls_pack

#endif // HLS_PACK_CONVERTER_HPP
