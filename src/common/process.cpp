#include "sessionflow/common/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sessionflow::common {

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

void close_pair(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

} // namespace

std::string join_argv(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

Result<ProcessResult> SubprocessRunner::run(const std::vector<std::string> &argv,
                                            const ProcessOptions &options) {
  if (argv.empty() || argv.front().empty()) {
    return Result<ProcessResult>::failure("command is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);
    return Result<ProcessResult>::failure("failed to create pipes for " + argv.front());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);
    return Result<ProcessResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);

    if (options.working_dir.has_value() && chdir(options.working_dir->c_str()) != 0) {
      _exit(126);
    }

    std::vector<char *> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      cargs.push_back(const_cast<char *>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    execvp(cargs[0], cargs.data());
    _exit(127);
  }

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

    if (std::chrono::steady_clock::now() - started > options.timeout) {
      result.timed_out = true;
      (void)kill(pid, SIGKILL);
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

  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (result.timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return Result<ProcessResult>::failure("command timed out: " + join_argv(argv));
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    if (result.exit_code == 127) {
      return Result<ProcessResult>::failure("command not found: " + argv.front());
    }
    const std::string message = result.stderr_text.empty()
                                    ? "command failed: " + join_argv(argv)
                                    : result.stderr_text;
    return Result<ProcessResult>::failure(message);
  }

  return Result<ProcessResult>::success(std::move(result));
}

} // namespace sessionflow::common
