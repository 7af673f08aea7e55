/**
 * @file subprocess.cpp
 * @brief fork/exec child process implementation
 */

#include "hls_pack/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace hls_pack {

namespace {

constexpr size_t READ_CHUNK = 4096;

/**
 * Fork and exec argv with the given descriptors as stdout/stderr.
 * -1 for a descriptor means /dev/null. Returns the child pid or -1.
 */
pid_t spawn(const std::vector<std::string> &argv, int out_fd, int err_fd,
            std::string &error) {
  if (argv.empty()) {
    error = "empty command";
    return -1;
  }

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    error = fmt::format("fork failed: {}", std::strerror(errno));
    return -1;
  }

  if (pid == 0) {
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
    }
    dup2(out_fd >= 0 ? out_fd : devnull, STDOUT_FILENO);
    dup2(err_fd >= 0 ? err_fd : devnull, STDERR_FILENO);
    execvp(c_argv[0], c_argv.data());
    _exit(EXEC_FAILED_STATUS);
  }
  return pid;
}

/// Reap pid, translating the wait status
int reap(pid_t pid, std::string &error) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      error = fmt::format("waitpid failed: {}", std::strerror(errno));
      return -1;
    }
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // anonymous namespace

std::string join_command(const std::vector<std::string> &argv) {
  std::string out;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      out += ' ';
    out += argv[i];
  }
  return out;
}

// **----- Subprocess -----**

Subprocess::Subprocess(std::vector<std::string> argv)
    : argv_(std::move(argv)) {}

Subprocess::~Subprocess() {
  if (pid_ > 0) {
    kill(pid_, SIGKILL);
    std::string ignored;
    reap(pid_, ignored);
    pid_ = -1;
  }
  close_pipe();
}

std::string Subprocess::command_line() const { return join_command(argv_); }

void Subprocess::close_pipe() {
  if (stderr_fd_ >= 0) {
    close(stderr_fd_);
    stderr_fd_ = -1;
  }
}

bool Subprocess::start() {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    error_ = fmt::format("pipe failed: {}", std::strerror(errno));
    return false;
  }

  pid_ = spawn(argv_, -1, fds[1], error_);
  close(fds[1]);
  if (pid_ < 0) {
    close(fds[0]);
    return false;
  }

  stderr_fd_ = fds[0];
  eof_ = false;
  buffer_.clear();
  return true;
}

bool Subprocess::read_line(std::string &line) {
  while (true) {
    size_t end = buffer_.find_first_of("\r\n");
    while (end != std::string::npos) {
      line = buffer_.substr(0, end);
      buffer_.erase(0, end + 1);
      if (!line.empty())
        return true;
      end = buffer_.find_first_of("\r\n");
    }

    if (eof_ || stderr_fd_ < 0) {
      if (buffer_.empty())
        return false;
      line.swap(buffer_);
      buffer_.clear();
      return true;
    }

    char chunk[READ_CHUNK];
    ssize_t n = read(stderr_fd_, chunk, sizeof(chunk));
    if (n > 0) {
      buffer_.append(chunk, static_cast<size_t>(n));
    } else if (n == 0) {
      eof_ = true;
    } else if (errno != EINTR) {
      eof_ = true;
    }
  }
}

int Subprocess::wait() {
  if (pid_ <= 0)
    return exit_status_;

  /// Drain whatever is left so the child cannot block on a full pipe
  std::string discard;
  while (read_line(discard)) {
  }
  close_pipe();

  exit_status_ = reap(pid_, error_);
  pid_ = -1;
  return exit_status_;
}

// **----- One-shot execution -----**

int run_capture(const std::vector<std::string> &argv, std::string &out,
                std::string &err) {
  out.clear();
  err.clear();

  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) != 0)
    return -1;
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    return -1;
  }

  std::string spawn_error;
  pid_t pid = spawn(argv, out_pipe[1], err_pipe[1], spawn_error);
  close(out_pipe[1]);
  close(err_pipe[1]);
  if (pid < 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    err = spawn_error;
    return -1;
  }

  /// Drain both pipes together; reading one to EOF first can deadlock
  pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
  std::string *sinks[2] = {&out, &err};
  int open_count = 2;
  char chunk[READ_CHUNK];

  while (open_count > 0) {
    if (poll(fds, 2, -1) < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = read(fds[i].fd, chunk, sizeof(chunk));
      if (n > 0) {
        sinks[i]->append(chunk, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        close(fds[i].fd);
        fds[i].fd = -1;
        --open_count;
      }
    }
  }

  for (auto &p : fds) {
    if (p.fd >= 0)
      close(p.fd);
  }

  std::string wait_error;
  return reap(pid, wait_error);
}

} // namespace hls_pack
