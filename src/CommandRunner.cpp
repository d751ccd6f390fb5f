#include "CommandRunner.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

static void close_fd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

bool PosixCommandRunner::run(const std::vector<std::string>& argv,
                             long timeout_ms,
                             CommandResult& out) {
  out = CommandResult{};
  if (argv.empty()) return false;

  // Built before fork(): the child may only make async-signal-safe calls.
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  int out_pipe[2] = { -1, -1 };
  int err_pipe[2] = { -1, -1 };
  int exec_pipe[2] = { -1, -1 };  // carries errno if execvp fails
  if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
      pipe2(exec_pipe, O_CLOEXEC) < 0) {
    spdlog::warn("pipe2 failed: {}", std::strerror(errno));
    for (int* p : { out_pipe, err_pipe, exec_pipe }) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return false;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("fork failed: {}", std::strerror(errno));
    for (int* p : { out_pipe, err_pipe, exec_pipe }) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return false;
  }

  if (pid == 0) {
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(args[0], args.data());
    const int e = errno;
    ssize_t ignored = write(exec_pipe[1], &e, sizeof(e));
    (void)ignored;
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  // EOF here means exec succeeded (CLOEXEC closed the write end).
  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n == (ssize_t)sizeof(exec_errno)) {
    int status = 0;
    waitpid(pid, &status, 0);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    out.not_found = (exec_errno == ENOENT);
    spdlog::debug("Cannot run {}: {}", argv[0], std::strerror(exec_errno));
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  int fds[2] = { out_pipe[0], err_pipe[0] };
  std::string* sinks[2] = { &out.out, &out.err };

  while (fds[0] >= 0 || fds[1] >= 0) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) {
      out.timed_out = true;
      kill(pid, SIGKILL);
      break;
    }

    struct pollfd pfds[2];
    int npfd = 0;
    int which[2];
    for (int i = 0; i < 2; i++) {
      if (fds[i] < 0) continue;
      pfds[npfd].fd = fds[i];
      pfds[npfd].events = POLLIN;
      pfds[npfd].revents = 0;
      which[npfd] = i;
      npfd++;
    }

    const int rc = poll(pfds, npfd, (int)remaining);
    if (rc < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed: {}", std::strerror(errno));
      out.timed_out = true;
      kill(pid, SIGKILL);
      break;
    }

    for (int k = 0; k < npfd; k++) {
      if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      const int i = which[k];
      char buf[4096];
      const ssize_t got = read(fds[i], buf, sizeof(buf));
      if (got > 0) {
        sinks[i]->append(buf, (size_t)got);
      } else if (got == 0 || errno != EINTR) {
        close_fd(fds[i]);
      }
    }
  }

  close_fd(fds[0]);
  close_fd(fds[1]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

  if (out.timed_out) return false;

  out.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return true;
}
