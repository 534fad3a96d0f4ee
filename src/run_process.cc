// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "run_process.hpp"

#include "atres_helpers.hpp"
#include "unique_fd.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace afltriage {

namespace {
constexpr size_t k_read_chunk_size = 64 * 1024;

struct Pipe {
  UniqueFd read_end;
  UniqueFd write_end;
};

bool make_pipe(Pipe &p) {
  int pipefd[2];
  if (pipe2(pipefd, O_CLOEXEC) == -1) {
    return false;
  }
  p.read_end = UniqueFd{pipefd[0]};
  p.write_end = UniqueFd{pipefd[1]};
  return true;
}

pid_t waitpid_no_eintr(pid_t pid, int *status) {
  pid_t res;
  do {
    res = waitpid(pid, status, 0);
  } while (res == -1 && errno == EINTR);
  return res;
}

[[noreturn]] void exec_child(const std::string &executable,
                             std::vector<char *> &argv, int stdout_fd,
                             int stderr_fd, int error_fd) {
  // Only async-signal-safe calls from here
  int const devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (devnull == -1 || dup2(devnull, STDIN_FILENO) == -1 ||
      dup2(stdout_fd, STDOUT_FILENO) == -1 ||
      dup2(stderr_fd, STDERR_FILENO) == -1) {
    int const e = errno;
    (void)!write(error_fd, &e, sizeof(e));
    _exit(127);
  }
  execvp(executable.c_str(), argv.data());
  int const e = errno;
  (void)!write(error_fd, &e, sizeof(e));
  _exit(127);
}

// Read both pipes until they are closed by the child
ATRes drain_pipes(int stdout_fd, int stderr_fd, ProcessOutput &output) {
  std::array<pollfd, 2> fds = {pollfd{stdout_fd, POLLIN, 0},
                               pollfd{stderr_fd, POLLIN, 0}};
  std::array<std::string *, 2> dest = {&output.out, &output.err};
  std::vector<char> buf(k_read_chunk_size);
  int open_fds = 2;

  while (open_fds > 0) {
    int const res = poll(fds.data(), fds.size(), -1);
    if (res == -1) {
      if (errno == EINTR) {
        continue;
      }
      ATRES_CHECK_ERRNO(-1, AT_WHAT_PROCESS_IO, "Unable to poll child output");
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
        continue;
      }
      ssize_t const n = read(fds[i].fd, buf.data(), buf.size());
      if (n == -1 && errno == EINTR) {
        continue;
      }
      ATRES_CHECK_ERRNO(n, AT_WHAT_PROCESS_IO, "Unable to read child output");
      if (n == 0) {
        // EOF: poll ignores negative descriptors
        fds[i].fd = -1;
        --open_fds;
        continue;
      }
      dest[i]->append(buf.data(), n);
    }
  }
  return {};
}
} // namespace

bool ProcessOutput::exit_success() const {
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

int ProcessOutput::exit_code() const {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

ATRes run_process(const std::string &executable,
                  std::span<const std::string> args, ProcessOutput &output) {
  Pipe out_pipe;
  Pipe err_pipe;
  Pipe exec_error_pipe;
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) ||
      !make_pipe(exec_error_pipe)) {
    ATRES_CHECK_ERRNO(-1, AT_WHAT_SPAWN, "Unable to create pipes for %s",
                      executable.c_str());
  }

  // argv is built before fork: no allocation in the child
  std::vector<std::string> arg_storage;
  arg_storage.reserve(args.size() + 1);
  arg_storage.push_back(executable);
  arg_storage.insert(arg_storage.end(), args.begin(), args.end());
  std::vector<char *> argv;
  argv.reserve(arg_storage.size() + 1);
  for (auto &arg : arg_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  pid_t const pid = fork();
  ATRES_CHECK_ERRNO(pid, AT_WHAT_SPAWN, "Unable to fork for %s",
                    executable.c_str());
  if (pid == 0) {
    // pipes are O_CLOEXEC: dup2'd copies survive exec, originals do not
    exec_child(executable, argv, out_pipe.write_end.get(),
               err_pipe.write_end.get(), exec_error_pipe.write_end.get());
  }

  out_pipe.write_end.reset();
  err_pipe.write_end.reset();
  exec_error_pipe.write_end.reset();

  // Closed on successful exec, otherwise carries errno
  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(exec_error_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
  } while (n == -1 && errno == EINTR);
  if (n == sizeof(exec_errno)) {
    waitpid_no_eintr(pid, nullptr);
    ATRES_RETURN_ERROR_LOG(AT_WHAT_SPAWN, "Failed to execute '%s': %s",
                           executable.c_str(), strerror(exec_errno));
  }

  ProcessOutput result;
  ATRes const drain_res = drain_pipes(out_pipe.read_end.get(),
                                      err_pipe.read_end.get(), result);
  // the child is reaped whatever happened to its output
  out_pipe.read_end.reset();
  err_pipe.read_end.reset();
  if (waitpid_no_eintr(pid, &result.status) == -1) {
    ATRES_CHECK_ERRNO(-1, AT_WHAT_PROCESS_IO, "Unable to wait for %s",
                      executable.c_str());
  }
  ATRES_CHECK_FWD(drain_res);

  LG_DBG("%s exited with status %d (%zu bytes on stdout, %zu on stderr)",
         executable.c_str(), result.exit_code(), result.out.size(),
         result.err.size());
  output = std::move(result);
  return {};
}

} // namespace afltriage
