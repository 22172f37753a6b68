#include "paramvault/common/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <initializer_list>
#include <poll.h>
#include <sys/types.h>
#include <pthread.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace paramvault::common {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void read_into_buffer(const int fd, std::string &buffer) {
  if (fd < 0) {
    return;
  }
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

bool write_all(const int fd, const std::string &data) {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t bytes = write(fd, data.data() + written, data.size() - written);
    if (bytes < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(bytes);
  }
  return true;
}

// Owns fd. SIGPIPE stays blocked on this thread, so a child that exits early
// surfaces as EPIPE and the pending signal is dropped with the thread.
void feed_stdin(int fd, const std::string &text) {
  sigset_t pipe_signal;
  sigemptyset(&pipe_signal);
  sigaddset(&pipe_signal, SIGPIPE);
  (void)pthread_sigmask(SIG_BLOCK, &pipe_signal, nullptr);
  (void)write_all(fd, text);
  close_fd(fd);
}

} // namespace

Result<ProcessResult> SubprocessRunner::run(const std::vector<std::string> &argv,
                                            const ProcessOptions &options) {
  if (argv.empty()) {
    return Result<ProcessResult>::failure("command is empty", ErrorCode::InvalidArgument);
  }
  const std::string &program = argv.front();

  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  const auto close_all = [&]() {
    for (int *pipe_fds : std::initializer_list<int *>{stdin_pipe, stdout_pipe, stderr_pipe}) {
      close_fd(pipe_fds[0]);
      close_fd(pipe_fds[1]);
    }
  };

  if ((options.stdin_text.has_value() && pipe(stdin_pipe) != 0) || pipe(stdout_pipe) != 0 ||
      (!options.inherit_stderr && pipe(stderr_pipe) != 0)) {
    close_all();
    return Result<ProcessResult>::failure("failed to create pipes for " + program,
                                          ErrorCode::DeviceUnavailable);
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_all();
    return Result<ProcessResult>::failure("failed to fork " + program,
                                          ErrorCode::DeviceUnavailable);
  }

  if (pid == 0) {
    if (stdin_pipe[0] >= 0) {
      (void)dup2(stdin_pipe[0], STDIN_FILENO);
    }
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    if (stderr_pipe[1] >= 0) {
      (void)dup2(stderr_pipe[1], STDERR_FILENO);
    }
    close_all();

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    execvp(program.c_str(), args.data());
    _exit(127);
  }

  close_fd(stdin_pipe[0]);
  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);

  // Fed from its own thread so a child that writes before draining stdin cannot
  // deadlock against us.
  std::thread stdin_feeder;
  if (stdin_pipe[1] >= 0) {
    stdin_feeder = std::thread(feed_stdin, stdin_pipe[1], std::cref(*options.stdin_text));
    stdin_pipe[1] = -1;
  }

  set_non_blocking(stdout_pipe[0]);
  if (stderr_pipe[0] >= 0) {
    set_non_blocking(stderr_pipe[0]);
  }

  std::string stdout_text;
  std::string stderr_text;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    read_into_buffer(stdout_pipe[0], stdout_text);
    read_into_buffer(stderr_pipe[0], stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    if (options.timeout.has_value() &&
        std::chrono::steady_clock::now() - started > *options.timeout) {
      timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, stderr_pipe[0] >= 0 ? 2 : 1, 50);
  }

  if (stdin_feeder.joinable()) {
    stdin_feeder.join();
  }
  read_into_buffer(stdout_pipe[0], stdout_text);
  read_into_buffer(stderr_pipe[0], stderr_text);
  close_all();

  ProcessResult result;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  if (timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return Result<ProcessResult>::failure(program + " timed out", ErrorCode::DeviceUnavailable);
    }
  }

  if (result.exit_code == 127 && !options.allow_failure) {
    return Result<ProcessResult>::failure(program + " is not installed or not on PATH",
                                          ErrorCode::DeviceUnavailable);
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? program + " exited with status " +
                                          std::to_string(result.exit_code)
                                    : program + ": " + result.stderr_text;
    return Result<ProcessResult>::failure(message, ErrorCode::DeviceUnavailable);
  }

  return Result<ProcessResult>::success(std::move(result));
}

} // namespace paramvault::common
