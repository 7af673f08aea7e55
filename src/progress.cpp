/**
 * @file progress.cpp
 * @brief Progress registry, reporter and display implementation
 */

#include "hls_pack/progress.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "hls_pack/subprocess.hpp"
#include "hls_pack/system.hpp"

namespace hls_pack {

// **----- ProgressRegistry -----**

ProgressTask ProgressRegistry::add_task(std::string description,
                                        double total) {
  std::lock_guard<std::mutex> lock(mutex_);
  TaskId id = next_id_++;
  tasks_.emplace(id, Entry{std::move(description), total > 0 ? total : 1.0,
                           0.0});
  return ProgressTask(this, id);
}

std::vector<TaskSnapshot> ProgressRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TaskSnapshot> out;
  out.reserve(tasks_.size());
  for (const auto &kv : tasks_) {
    out.push_back({kv.first, kv.second.description, kv.second.total,
                   kv.second.completed});
  }
  return out;
}

std::optional<TaskSnapshot> ProgressRegistry::get(TaskId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(id);
  if (it == tasks_.end())
    return std::nullopt;
  return TaskSnapshot{id, it->second.description, it->second.total,
                      it->second.completed};
}

size_t ProgressRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void ProgressRegistry::update(TaskId id, double completed) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(id);
  if (it == tasks_.end() || !std::isfinite(completed))
    return;
  Entry &e = it->second;
  e.completed = std::max(e.completed, std::min(completed, e.total));
}

void ProgressRegistry::complete(TaskId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(id);
  if (it != tasks_.end())
    it->second.completed = it->second.total;
}

void ProgressRegistry::remove(TaskId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.erase(id);
}

// **----- ProgressTask -----**

ProgressTask::~ProgressTask() {
  if (registry_)
    registry_->remove(id_);
}

ProgressTask::ProgressTask(ProgressTask &&other) noexcept
    : registry_(other.registry_), id_(other.id_) {
  other.registry_ = nullptr;
  other.id_ = -1;
}

ProgressTask &ProgressTask::operator=(ProgressTask &&other) noexcept {
  if (this != &other) {
    if (registry_)
      registry_->remove(id_);
    registry_ = other.registry_;
    id_ = other.id_;
    other.registry_ = nullptr;
    other.id_ = -1;
  }
  return *this;
}

void ProgressTask::update(double seconds) {
  if (registry_)
    registry_->update(id_, seconds);
}

void ProgressTask::complete() {
  if (registry_)
    registry_->complete(id_);
}

// **----- Diagnostic parsing -----**

namespace {

constexpr const char *TIME_MARKER = "time=";

/// Parse a non-negative decimal field covering the whole string
std::optional<double> parse_field(const std::string &text) {
  if (text.empty() || text[0] == '-' || text[0] == '+')
    return std::nullopt;
  try {
    size_t used = 0;
    double value = std::stod(text, &used);
    if (used != text.size() || !std::isfinite(value))
      return std::nullopt;
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

} // anonymous namespace

bool has_time_marker(const std::string &line) {
  return line.find(TIME_MARKER) != std::string::npos;
}

std::optional<double> parse_elapsed_time(const std::string &line) {
  size_t start = line.find(TIME_MARKER);
  if (start == std::string::npos)
    return std::nullopt;
  start += std::char_traits<char>::length(TIME_MARKER);

  size_t end = line.find(' ', start);
  std::string value = line.substr(start, end == std::string::npos
                                             ? std::string::npos
                                             : end - start);

  size_t c1 = value.find(':');
  size_t c2 = (c1 == std::string::npos) ? c1 : value.find(':', c1 + 1);
  if (c2 == std::string::npos || value.find(':', c2 + 1) != std::string::npos)
    return std::nullopt;

  auto h = parse_field(value.substr(0, c1));
  auto m = parse_field(value.substr(c1 + 1, c2 - c1 - 1));
  auto s = parse_field(value.substr(c2 + 1));
  if (!h || !m || !s)
    return std::nullopt;
  return *h * 3600.0 + *m * 60.0 + *s;
}

// **----- Reporter -----**

RunOutcome run_with_progress(const std::vector<std::string> &argv,
                             ProgressTask &task, Logger &log) {
  RunOutcome outcome;
  Subprocess process(argv);

  log.debug("Running: {}", process.command_line());
  if (!process.start()) {
    task.complete();
    log.error("Failed to start encoder: {}", process.error());
    return outcome;
  }

  std::string line;
  while (process.read_line(line)) {
    outcome.diagnostics += line;
    outcome.diagnostics += '\n';
    if (!has_time_marker(line))
      continue;
    if (auto seconds = parse_elapsed_time(line)) {
      task.update(*seconds);
    } else {
      log.debug("Could not parse time from line: {}", line);
    }
  }

  outcome.exit_status = process.wait();
  task.complete();

  outcome.success = (outcome.exit_status == 0);
  if (!outcome.success) {
    if (outcome.exit_status == EXEC_FAILED_STATUS) {
      log.error("Encoder could not be executed: {}",
                argv.empty() ? std::string() : argv[0]);
    }
    log.error("Encoder command failed (status {}): {}\nErrors: {}",
              outcome.exit_status, process.command_line(),
              outcome.diagnostics);
  }
  return outcome;
}

// **----- Display -----**

std::string render_progress_line(const TaskSnapshot &task, int bar_width) {
  double fraction = task.total > 0 ? task.completed / task.total : 1.0;
  fraction = std::clamp(fraction, 0.0, 1.0);
  int filled = static_cast<int>(std::floor(fraction * bar_width));

  std::string bar(static_cast<size_t>(filled), '#');
  bar.append(static_cast<size_t>(bar_width - filled), '-');

  return fmt::format("{} [{}] {:3d}% {}/{}", task.description, bar,
                     static_cast<int>(std::floor(fraction * 100.0)),
                     format_time(task.completed), format_time(task.total));
}

ProgressDisplay::ProgressDisplay(const ProgressRegistry &registry,
                                 std::FILE *out, int interval_ms)
    : registry_(registry), out_(out), interval_ms_(interval_ms) {}

ProgressDisplay::~ProgressDisplay() { stop(); }

void ProgressDisplay::start() {
  if (running_.exchange(true))
    return;
  thread_ = std::thread(&ProgressDisplay::loop, this);
}

void ProgressDisplay::stop() {
  {
    /// Under the lock so the flag cannot flip between the wait predicate
    /// check and the sleep
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false))
      return;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
  clear();
}

void ProgressDisplay::loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_.load()) {
    redraw();
    cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                 [this] { return !running_.load(); });
  }
}

void ProgressDisplay::clear() {
  if (drawn_lines_ > 0)
    std::fputs("\r\033[2K", out_);
  drawn_lines_ = 0;
  std::fflush(out_);
}

void ProgressDisplay::redraw() {
  auto tasks = registry_.snapshot();
  clear();
  if (tasks.empty())
    return;

  /// All active tasks share one status line so log output is not erased
  std::string status;
  for (const auto &t : tasks) {
    if (!status.empty())
      status += " | ";
    status += render_progress_line(t, tasks.size() > 1 ? 10 : 30);
  }
  std::fputs(status.c_str(), out_);
  drawn_lines_ = 1;
  std::fflush(out_);
}

} // namespace hls_pack
