#include "sandcastle/common/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandcastle::common {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void drain(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    return;
  }
}

void close_pair(int (&fds)[2]) {
  for (int &fd : fds) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

} // namespace

Result<ProcessResult> run_shell_command(const std::string &command,
                                        const std::filesystem::path &cwd,
                                        const std::chrono::milliseconds timeout) {
  if (command.empty()) {
    return Result<ProcessResult>::failure("command is empty", ErrorCode::InvalidArgument);
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);
    return Result<ProcessResult>::failure("failed to create pipes");
  }

  const std::string cwd_text = cwd.string();
  const pid_t pid = fork();
  if (pid < 0) {
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);
    return Result<ProcessResult>::failure("failed to fork shell process");
  }

  if (pid == 0) {
    // Own process group so a timeout reaches everything the shell spawned.
    (void)setpgid(0, 0);
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);

    if (!cwd_text.empty() && chdir(cwd_text.c_str()) != 0) {
      _exit(126);
    }
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }
  (void)setpgid(pid, pid);

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  ProcessResult result;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    drain(stdout_pipe[0], result.stdout_text);
    drain(stderr_pipe[0], result.stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      break;
    }

    if (std::chrono::steady_clock::now() - started > timeout) {
      result.timed_out = true;
      (void)kill(-pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  drain(stdout_pipe[0], result.stdout_text);
  drain(stderr_pipe[0], result.stderr_text);
  close(stdout_pipe[0]);
  close(stderr_pipe[0]);

  if (result.timed_out) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }

  return Result<ProcessResult>::success(std::move(result));
}

} // namespace sandcastle::common
