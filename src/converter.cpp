/**
 * @file converter.cpp
 * @brief Per-file conversion implementation
 *
 * @details State flow for one file:
 *
 *          Probing -> Classifying -> PerTrackProcessing -> Assembling
 *          -> (Cleanup) -> Done
 *
 *          Failed is reachable from Probing only.
 */

#include "hls_pack/converter.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <thread>

#include "hls_pack/cleanup.hpp"
#include "hls_pack/job_queue.hpp"
#include "hls_pack/playlist_writer.hpp"
#include "hls_pack/prober.hpp"
#include "hls_pack/system.hpp"
#include "hls_pack/track_classifier.hpp"

namespace hls_pack {

namespace fs = std::filesystem;

const char *file_state_name(FileState state) {
  switch (state) {
  case FileState::Probing:
    return "Probing";
  case FileState::Classifying:
    return "Classifying";
  case FileState::PerTrackProcessing:
    return "PerTrackProcessing";
  case FileState::Assembling:
    return "Assembling";
  case FileState::Cleanup:
    return "Cleanup";
  case FileState::Done:
    return "Done";
  case FileState::Failed:
    return "Failed";
  }
  return "Unknown";
}

// **---- Constructor ----**

FileConverter::FileConverter(ConverterOptions options,
                             ProgressRegistry &registry, Logger &log)
    : options_(std::move(options)), registry_(registry), log_(log) {
  options_.parallel_jobs = std::max(1, options_.parallel_jobs);
}

fs::path FileConverter::output_root_for(const fs::path &input) {
  std::string name = sanitize_filename(input.stem().string());
  if (name.empty())
    name = "media";
  return input.parent_path() / name;
}

// **---- Planning ----**

std::vector<PlannedJob>
FileConverter::plan_jobs(const SourceContainer &source,
                         const TrackLists &tracks, const fs::path &root) const {
  std::vector<PlannedJob> jobs;

  for (const auto &track : tracks.video) {
    const Stream &s = *track.stream;
    if (!s.height) {
      log_.warn("Could not determine the height of video {}. Using the "
                "default resolutions.",
                track.index);
    }
    for (const auto &rung : plan_ladder(options_.ladder, s.width, s.height)) {
      jobs.push_back({build_video_job(source.path, root, track.index, rung,
                                      source.duration, options_.encoder),
                      track});
    }
  }
  for (const auto &track : tracks.audio) {
    jobs.push_back({build_audio_job(source.path, root, track.index,
                                    source.duration, options_.encoder),
                    track});
  }
  for (const auto &track : tracks.subtitle) {
    jobs.push_back({build_subtitle_job(source.path, root, track.index,
                                       source.duration, options_.encoder),
                    track});
  }
  return jobs;
}

// **---- Execution ----**

bool FileConverter::execute(const Job &job) {
  std::error_code ec;
  fs::create_directories(job.output_dir, ec);
  if (ec) {
    log_.error("Cannot create {}: {}", job.output_dir.string(), ec.message());
    return false;
  }

  ProgressTask task = registry_.add_task(job.description, job.progress_total);
  RunOutcome outcome = run_with_progress(job.args, task, log_);
  if (!outcome.success) {
    log_.error("HLS creation failed for {}", job.description);
    return false;
  }

  if (job.type == TrackType::Subtitle) {
    log_.info("Subtitle {} extracted to {}", job.track_index,
              job.output_file.string());
    return write_subtitle_playlist(job.playlist_file,
                                   job.output_file.filename().string(), log_);
  }

  log_.info("HLS for {} created at {}", job.description,
            job.playlist_file.string());
  return true;
}

std::vector<char> FileConverter::run_jobs(const std::vector<PlannedJob> &jobs) {
  std::vector<char> outcomes(jobs.size(), 0);
  int workers = std::min<int>(options_.parallel_jobs,
                              static_cast<int>(jobs.size()));

  if (workers <= 1) {
    for (size_t i = 0; i < jobs.size(); ++i) {
      outcomes[i] = execute(jobs[i].job) ? 1 : 0;
    }
    return outcomes;
  }

  JobQueue queue;
  for (size_t i = 0; i < jobs.size(); ++i) {
    queue.push({i, jobs[i].job});
  }
  queue.finish();

  /// Each worker writes only the slots of the jobs it popped
  std::vector<std::thread> pool;
  pool.reserve(static_cast<size_t>(workers));
  for (int w = 0; w < workers; ++w) {
    pool.emplace_back([this, &queue, &outcomes, w]() {
      QueuedJob queued{};
      int done = 0;
      while (queue.pop(queued)) {
        outcomes[queued.slot] = execute(queued.job) ? 1 : 0;
        ++done;
      }
      log_.debug("[Worker {}] Finished ({} jobs)", w, done);
    });
  }
  for (auto &t : pool) {
    t.join();
  }
  return outcomes;
}

void FileConverter::add_result(const PlannedJob &planned, const fs::path &root,
                               MasterPlaylist &master) const {
  const Job &job = planned.job;
  std::string uri = relative_uri(job.playlist_file, root);

  switch (job.type) {
  case TrackType::Video: {
    const RenditionSpec &r = *job.rendition;
    master.video.push_back(
        {uri, r.width, r.height, static_cast<long>(r.bitrate_kbps) * 1000});
    break;
  }
  case TrackType::Audio:
    master.audio.push_back({uri, display_name(planned.track),
                            language_code(planned.track),
                            planned.track.stream->is_default});
    break;
  case TrackType::Subtitle:
    master.subtitles.push_back(
        {uri, display_name(planned.track), language_code(planned.track)});
    break;
  case TrackType::Other:
    break;
  }
}

// **---- Main Processing ----**

FileReport FileConverter::convert(const fs::path &input) {
  auto start_time = std::chrono::steady_clock::now();
  auto finish = [&start_time](FileReport &report) {
    report.processing_time_us =
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time)
            .count();
  };

  FileReport report;
  report.input = input;
  report.output_root = output_root_for(input);

  log_.phase("Processing file: {}...", input.filename().string());

  // **----- PROBING -----**

  report.state = FileState::Probing;
  std::error_code ec;
  fs::create_directories(report.output_root, ec);
  if (ec) {
    log_.error("Cannot create output directory {}: {}",
               report.output_root.string(), ec.message());
    report.state = FileState::Failed;
    report.failure = ErrorKind::ProbeFailure;
    finish(report);
    return report;
  }

  auto probe = probe_media(options_.ffprobe, input, log_);
  if (!probe) {
    log_.error("Could not generate {} for {}", PROBE_SNAPSHOT_NAME,
               input.filename().string());
    report.state = FileState::Failed;
    report.failure = ErrorKind::ProbeFailure;
    finish(report);
    return report;
  }
  if (!write_probe_snapshot(*probe, report.output_root, log_)) {
    log_.warn("Continuing without {}", PROBE_SNAPSHOT_NAME);
  }
  const SourceContainer source = container_from_probe(*probe, input);
  if (source.duration) {
    log_.debug("Duration of {}: {:.2f} seconds", input.filename().string(),
               *source.duration);
  } else {
    log_.warn("Duration of {} unknown, progress uses {:.0f}s",
              input.filename().string(), PLACEHOLDER_DURATION_SEC);
  }

  // **----- CLASSIFYING -----**

  report.state = FileState::Classifying;
  TrackLists tracks = classify_tracks(source, log_);
  log_.info("Tracks: {} video, {} audio, {} subtitle", tracks.video.size(),
            tracks.audio.size(), tracks.subtitle.size());

  // **----- PER-TRACK PROCESSING -----**

  report.state = FileState::PerTrackProcessing;
  std::vector<PlannedJob> jobs = plan_jobs(source, tracks, report.output_root);
  report.jobs_total = jobs.size();

  std::vector<char> outcomes = run_jobs(jobs);
  for (size_t i = 0; i < jobs.size(); ++i) {
    if (outcomes[i]) {
      add_result(jobs[i], report.output_root, report.master);
    } else {
      ++report.jobs_failed;
      log_.warn("{}: dropped rendition {}",
                error_kind_name(ErrorKind::RenditionFailure),
                jobs[i].job.description);
    }
  }

  // **----- ASSEMBLING -----**

  report.state = FileState::Assembling;
  report.master_written =
      write_master_playlist(report.output_root, report.master, log_);
  if (!report.master_written) {
    log_.error("{}: renditions in {} were kept",
               error_kind_name(ErrorKind::ManifestWriteFailure),
               report.output_root.string());
  }

  // **----- CLEANUP -----**

  if (options_.delete_intermediates) {
    if (report.master_written && report.jobs_failed == 0) {
      report.state = FileState::Cleanup;
      auto targets = collect_cleanup_targets(input, report.output_root,
                                             report.master, log_);
      report.files_removed = remove_paths(targets, log_);
      if (report.files_removed < targets.size()) {
        log_.warn("{}: {} of {} intermediate files left in place",
                  error_kind_name(ErrorKind::CleanupFailure),
                  targets.size() - report.files_removed, targets.size());
      }
      log_.success("Intermediate files removed.");
    } else {
      log_.warn("Conversion incomplete, intermediate files kept.");
    }
  } else {
    log_.info("Deletion of intermediate files disabled.");
  }

  report.state = FileState::Done;
  finish(report);
  log_.success("Processing completed for {} ({}/{} renditions)",
               input.filename().string(), report.master.size(),
               report.jobs_total);
  return report;
}

} // namespace hls_pack
