/**
 * @file progress.hpp
 * @brief Per-job progress tracking and reporting
 *
 * @details Provides:
 *
 *          - ProgressRegistry: thread-safe table of tasks keyed by id
 *
 *          - ProgressTask: move-only handle owned by the job that updates it
 *
 *          - run_with_progress(): drive an encoder and feed its elapsed-time
 *            diagnostics into a task
 *
 *          - ProgressDisplay: background thread rendering the registry
 *
 * @attention CONCURRENCY:
 *
 *   - Only the ProgressTask handle can change a task, so each task is
 *     written by the single worker that owns the job
 *
 *   - snapshot() may be called concurrently from the display thread
 */

#ifndef HLS_PACK_PROGRESS_HPP
#define HLS_PACK_PROGRESS_HPP

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "logging.hpp"

namespace hls_pack {

using TaskId = int;

/**
 * @struct TaskSnapshot
 * @brief Copy of one task's state at a point in time.
 */
struct TaskSnapshot {
  TaskId id;
  std::string description;
  double total;     //< Seconds
  double completed; //< Seconds, 0 <= completed <= total
};

class ProgressTask;

/**
 * @class ProgressRegistry
 * @brief Thread-safe registry of active progress tasks.
 */
class ProgressRegistry {
public:
  /**
   * @brief Register a task.
   * @param description Label shown by the display
   * @param total Task size in seconds (non-positive becomes 1)
   * @return Handle owning the task; the task is removed when it is destroyed
   */
  ProgressTask add_task(std::string description, double total);

  /// Copy of every active task, ordered by id
  std::vector<TaskSnapshot> snapshot() const;

  /// Copy of one task, empty if it no longer exists
  std::optional<TaskSnapshot> get(TaskId id) const;

  /// Number of active tasks
  size_t size() const;

private:
  friend class ProgressTask;

  struct Entry {
    std::string description;
    double total;
    double completed;
  };

  mutable std::mutex mutex_;
  std::map<TaskId, Entry> tasks_;
  TaskId next_id_ = 0;

  void update(TaskId id, double completed);
  void complete(TaskId id);
  void remove(TaskId id);
};

/**
 * @class ProgressTask
 * @brief Write handle for one registered task.
 * @note Move-only. Updates never decrease completed and never exceed total.
 */
class ProgressTask {
public:
  ProgressTask() = default;
  ~ProgressTask();

  ProgressTask(ProgressTask &&other) noexcept;
  ProgressTask &operator=(ProgressTask &&other) noexcept;
  ProgressTask(const ProgressTask &) = delete;
  ProgressTask &operator=(const ProgressTask &) = delete;

  TaskId id() const { return id_; }
  bool valid() const { return registry_ != nullptr; }

  /// Set completed to min(seconds, total), ignoring regressions
  void update(double seconds);

  /// Set completed = total
  void complete();

private:
  friend class ProgressRegistry;
  ProgressTask(ProgressRegistry *registry, TaskId id)
      : registry_(registry), id_(id) {}

  ProgressRegistry *registry_ = nullptr;
  TaskId id_ = -1;
};

// **----- Diagnostic parsing -----**

/// True if the line carries an elapsed-time marker ("time=")
bool has_time_marker(const std::string &line);

/**
 * @brief Parse the elapsed time from an encoder diagnostic line.
 * @note Reads the value after the first "time=" up to the next space,
 *       formatted HH:MM:SS(.ff).
 * @return Seconds, or empty when there is no marker or the value is
 *         malformed (e.g. "N/A")
 */
std::optional<double> parse_elapsed_time(const std::string &line);

/**
 * @struct RunOutcome
 * @brief Result of one external encoder run.
 */
struct RunOutcome {
  bool success = false;
  int exit_status = -1;
  std::string diagnostics; //< Every stderr line, newline separated
};

/**
 * @brief Run a command and report its progress into a task.
 *
 * @note Suspends the caller while waiting for each diagnostic line and for
 *       the process to exit. Malformed time values are logged at debug level
 *       and skipped. On exit the task is forced to complete regardless of the
 *       last parsed value. On failure the command and its diagnostics are
 *       logged as an error.
 *
 * @param argv Command line, argv[0] = encoder
 * @param task Task receiving progress updates
 * @param log Logger
 * @return Outcome with success = (exit status 0)
 */
RunOutcome run_with_progress(const std::vector<std::string> &argv,
                             ProgressTask &task, Logger &log);

// **----- Display -----**

/**
 * @brief Render one task as a single status line.
 * @note Format: "<description> [#####-----] 50% 00:01:00/00:02:00"
 */
std::string render_progress_line(const TaskSnapshot &task, int bar_width = 30);

/**
 * @class ProgressDisplay
 * @brief Periodically redraws every active task on one terminal line.
 * @note The redraw runs on its own thread and only reads the registry.
 */
class ProgressDisplay {
public:
  ProgressDisplay(const ProgressRegistry &registry, std::FILE *out,
                  int interval_ms = 500);
  ~ProgressDisplay();

  ProgressDisplay(const ProgressDisplay &) = delete;
  ProgressDisplay &operator=(const ProgressDisplay &) = delete;

  void start();

  /// Stop the thread and erase the status line
  void stop();

private:
  const ProgressRegistry &registry_;
  std::FILE *out_;
  int interval_ms_;
  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_{false};
  size_t drawn_lines_ = 0; //< 0 or 1

  void loop();
  void redraw();
  void clear();
};

} // namespace hls_pack

#endif // HLS_PACK_PROGRESS_HPP
