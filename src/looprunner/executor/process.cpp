#include "looprunner/executor/process.hpp"

#include "looprunner/core/constants.hpp"
#include "looprunner/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <optional>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace looprunner {

namespace {

struct Pipe {
  int read_fd{-1};
  int write_fd{-1};

  auto close_read() -> void {
    if (read_fd >= 0) {
      ::close(read_fd);
      read_fd = -1;
    }
  }
  auto close_write() -> void {
    if (write_fd >= 0) {
      ::close(write_fd);
      write_fd = -1;
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }
};

auto create_pipe(Pipe& p) -> bool {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return false;
  }
  p.read_fd = fds[0];
  p.write_fd = fds[1];
  return true;
}

struct ChildStatus {
  int exit_code{-1};
  int signal{0};
};

auto decode_status(int status) -> ChildStatus {
  if (WIFEXITED(status)) {
    return {.exit_code = WEXITSTATUS(status)};
  }
  if (WIFSIGNALED(status)) {
    return {.exit_code = 128 + WTERMSIG(status), .signal = WTERMSIG(status)};
  }
  return {};
}

// Returns false once the stream is at EOF or broken.
auto drain(int fd, std::string& out) -> bool {
  std::array<char, io::kReadBufferSize> buffer;
  ssize_t n = ::read(fd, buffer.data(), buffer.size());
  if (n < 0) {
    return errno == EINTR || errno == EAGAIN;
  }
  if (n == 0) {
    return false;
  }
  if (out.size() < io::kMaxOutputSize) {
    auto room = io::kMaxOutputSize - out.size();
    out.append(buffer.data(),
               std::min(room, static_cast<std::size_t>(n)));
  }
  return true;
}

auto wait_child(pid_t pid, bool kill_first) -> ChildStatus {
  if (kill_first) {
    ::kill(-pid, SIGKILL);
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      return {};
    }
  }
  return decode_status(status);
}

// The child may outlive its pipes (closed or handed to a daemon), so the
// deadline still applies once both streams are at EOF.
auto wait_child_until(pid_t pid,
                      std::chrono::steady_clock::time_point deadline)
    -> std::optional<ChildStatus> {
  while (true) {
    int status = 0;
    pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      return decode_status(status);
    }
    if (rc < 0 && errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      return ChildStatus{};
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(timing::kChildPollInterval);
  }
}

}  // namespace

auto run_process(const ProcessSpec& spec) -> ExecutorResult {
  ExecutorResult result;
  if (spec.argv.empty()) {
    result.exit_code = -1;
    result.error = "empty command";
    return result;
  }

  Pipe out_pipe;
  Pipe err_pipe;
  Pipe exec_pipe;
  if (!create_pipe(out_pipe) || !create_pipe(err_pipe) ||
      !create_pipe(exec_pipe)) {
    result.exit_code = -1;
    result.error = std::format("failed to create pipe: {}",
                               std::strerror(errno));
    return result;
  }

  std::vector<char*> argv;
  argv.reserve(spec.argv.size() + 1);
  for (const auto& arg : spec.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    result.exit_code = -1;
    result.error = std::format("failed to fork: {}", std::strerror(errno));
    return result;
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    ::setpgid(0, 0);
    ::dup2(out_pipe.write_fd, STDOUT_FILENO);
    ::dup2(err_pipe.write_fd, STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) < 0) {
      int err = errno;
      (void)!::write(exec_pipe.write_fd, &err, sizeof(err));
      ::_exit(127);
    }
    ::execvp(argv[0], argv.data());
    int err = errno;
    (void)!::write(exec_pipe.write_fd, &err, sizeof(err));
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  out_pipe.close_write();
  err_pipe.close_write();
  exec_pipe.close_write();

  // exec_pipe is CLOEXEC: EOF without data means exec succeeded.
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(exec_pipe.read_fd, &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    (void)wait_child(pid, false);
    result.exit_code = -1;
    result.error = std::format("failed to start '{}': {}", spec.argv.front(),
                               std::strerror(child_errno));
    return result;
  }

  result.stdout_output.reserve(io::kInitialOutputReserve);
  auto deadline = std::chrono::steady_clock::now() + spec.timeout;
  std::array<pollfd, 2> fds{{{out_pipe.read_fd, POLLIN, 0},
                             {err_pipe.read_fd, POLLIN, 0}}};
  std::array<std::string*, 2> sinks{&result.stdout_output,
                                    &result.stderr_output};
  int open_streams = 2;

  while (open_streams > 0) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }
    int rc = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.error = std::format("poll failed: {}", std::strerror(errno));
      break;
    }
    if (rc == 0) {
      result.timed_out = true;
      break;
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      if (!drain(fds[i].fd, *sinks[i])) {
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  ChildStatus child;
  if (result.timed_out || !result.error.empty()) {
    child = wait_child(pid, true);
  } else if (auto exited = wait_child_until(pid, deadline)) {
    child = *exited;
  } else {
    result.timed_out = true;
    child = wait_child(pid, true);
  }
  result.exit_code = child.exit_code;
  if (result.timed_out) {
    result.error = std::format("timed out after {}s", spec.timeout.count());
  } else if (child.signal != 0 && result.error.empty()) {
    result.error = std::format("killed by signal {} ({})", child.signal,
                               ::strsignal(child.signal));
  }
  return result;
}

}  // namespace looprunner
