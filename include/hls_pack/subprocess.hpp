/**
 * @file subprocess.hpp
 * @brief Child process execution with captured output
 *
 * @details Runs the external encoder and prober via fork/exec:
 *
 *          - Subprocess: RAII handle with line-by-line stderr reading
 *
 *          - run_capture(): run to completion, collecting stdout and stderr
 *
 * @note stdin of every child is /dev/null so the encoder never waits for
 *       terminal input.
 */

#ifndef HLS_PACK_SUBPROCESS_HPP
#define HLS_PACK_SUBPROCESS_HPP

#include <string>
#include <sys/types.h>
#include <vector>

namespace hls_pack {

/// Exit status reported when the binary could not be executed
constexpr int EXEC_FAILED_STATUS = 127;

/**
 * @class Subprocess
 * @brief A child process whose stderr is read line by line.
 *
 * @attention USAGE:
 *
 *   - start() forks and execs argv[0] (looked up on PATH)
 *
 *   - read_line() blocks until the next diagnostic line or EOF
 *
 *   - wait() reaps the child and returns its exit status
 *
 * @note The destructor kills and reaps a child that is still running.
 */
class Subprocess {
public:
  explicit Subprocess(std::vector<std::string> argv);
  ~Subprocess();

  Subprocess(const Subprocess &) = delete;
  Subprocess &operator=(const Subprocess &) = delete;

  /**
   * @brief Spawn the child with stdout discarded and stderr piped.
   * @return false if the pipe or fork failed (see error())
   */
  bool start();

  /**
   * @brief Read the next line of the child's stderr.
   * @note Lines end at '\n' or '\r'; empty lines are skipped. Blocks the
   *       caller until a line is complete or the stream ends.
   * @param line Output: the line without its terminator
   * @return false at end of stream
   */
  bool read_line(std::string &line);

  /**
   * @brief Wait for the child to exit.
   * @return Exit code, 128 + signal number if killed by a signal, -1 if the
   *         child was never started or could not be reaped
   */
  int wait();

  /// Description of the last start/wait failure
  const std::string &error() const { return error_; }

  /// argv joined with spaces, for log messages
  std::string command_line() const;

private:
  std::vector<std::string> argv_;
  pid_t pid_ = -1;
  int stderr_fd_ = -1;
  int exit_status_ = -1;
  std::string buffer_; //< Unconsumed stderr bytes
  bool eof_ = false;
  std::string error_;

  void close_pipe();
};

/**
 * @brief Run a command to completion and collect its output.
 *
 * @param argv Command and arguments, argv[0] looked up on PATH
 * @param out Output: everything written to stdout
 * @param err Output: everything written to stderr
 * @return Exit status as returned by Subprocess::wait(), -1 if the child
 *         could not be spawned
 */
int run_capture(const std::vector<std::string> &argv, std::string &out,
                std::string &err);

/// Join argv with spaces
std::string join_command(const std::vector<std::string> &argv);

} // namespace hls_pack

#endif // HLS_PACK_SUBPROCESS_HPP
