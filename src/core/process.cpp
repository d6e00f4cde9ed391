#include "core/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <thread>

namespace ups_sentinel::core {

namespace {

constexpr std::chrono::milliseconds kPollSlice{50};

void append_capped(std::string& output, const char* data, const std::size_t size) {
  if (output.size() >= kMaxCapturedOutput) {
    return;
  }
  output.append(data, std::min(size, kMaxCapturedOutput - output.size()));
}

// Returns false on EOF or a hard read error.
bool read_available(const int fd, std::string& output) {
  char chunk[4096]{};
  while (true) {
    const ssize_t bytes_read = ::read(fd, chunk, sizeof(chunk));
    if (bytes_read > 0) {
      append_capped(output, chunk, static_cast<std::size_t>(bytes_read));
      continue;
    }
    if (bytes_read == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

bool try_reap(const pid_t pid, int& status) {
  while (true) {
    const pid_t wait_result = waitpid(pid, &status, WNOHANG);
    if (wait_result == pid) {
      return true;
    }
    if (wait_result < 0 && errno == EINTR) {
      continue;
    }
    return false;
  }
}

void kill_and_reap(const pid_t pid, int& status) {
  kill(pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const std::chrono::milliseconds timeout) {
  ProcessResult result{};
  if (argv.empty()) {
    return result;
  }

  std::vector<char*> exec_argv;
  exec_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    exec_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  exec_argv.push_back(nullptr);

  int pipe_fds[2]{};
  if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    return result;
  }

  if (pid == 0) {
    dup2(pipe_fds[1], STDOUT_FILENO);
    dup2(pipe_fds[1], STDERR_FILENO);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
    }
    execvp(exec_argv[0], exec_argv.data());
    _exit(127);
  }

  close(pipe_fds[1]);
  const int read_fd = pipe_fds[0];
  const int flags = fcntl(read_fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(read_fd, F_SETFL, flags | O_NONBLOCK);
  }
  result.spawned = true;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool pipe_open = true;
  bool reaped = false;
  int status = 0;

  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      result.timed_out = true;
      break;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const auto slice = std::max(std::min(remaining, kPollSlice), std::chrono::milliseconds{1});

    if (pipe_open) {
      pollfd pfd{};
      pfd.fd = read_fd;
      pfd.events = POLLIN;
      const int poll_result = ::poll(&pfd, 1, static_cast<int>(slice.count()));
      if (poll_result > 0) {
        pipe_open = read_available(read_fd, result.output);
      } else if (poll_result < 0 && errno != EINTR) {
        pipe_open = false;
      }
    } else {
      std::this_thread::sleep_for(std::min(slice, std::chrono::milliseconds{10}));
    }

    if (try_reap(pid, status)) {
      reaped = true;
      // A grandchild may still hold the pipe; take what is buffered and stop.
      if (pipe_open) {
        (void)read_available(read_fd, result.output);
      }
      break;
    }
  }

  if (!reaped) {
    kill_and_reap(pid, status);
  }
  close(read_fd);

  if (!result.timed_out && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return result;
}

}  // namespace ups_sentinel::core
