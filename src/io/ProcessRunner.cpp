/* @file ProcessRunner.cpp
 * @brief fork/exec with a pipe and poll() deadline - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <iostream>
#include <stdexcept>
#include <system_error>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

// Keel headers
#include "io/ProcessRunner.hpp"

using namespace keel::io;

namespace {

  // closes on scope exit
  struct FdGuard {
    int fd{ -1 };
    ~FdGuard() { reset(); }
    void reset() {
      if (fd >= 0)
        ::close(fd);
      fd = -1;
    }
  };

  int waitChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
      if (errno != EINTR)
        return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  }

} // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout, const std::string& workDir) {
  if (argv.empty())
    throw std::invalid_argument("[ProcessRunner] empty argv");

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    throw std::system_error(errno, std::generic_category(), "[ProcessRunner] pipe");
  FdGuard readEnd{ fds[0] };
  FdGuard writeEnd{ fds[1] };

  // build argv before fork, the child must not allocate
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv)
    cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0)
    throw std::system_error(errno, std::generic_category(), "[ProcessRunner] fork");

  if (pid == 0) {
    // child
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    if (!workDir.empty() && ::chdir(workDir.c_str()) != 0)
      ::_exit(kExecFailed);
    ::execvp(cargv[0], cargv.data());
    ::_exit(kExecFailed);
  }

  writeEnd.reset(); // parent keeps only the read side

  ProcessResult result;
  char temp[4096];
  pollfd pfd{ readEnd.fd, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  for (;;) {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (ms_left.count() <= 0) {
      result.timedOut = true;
      break;
    }

    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      break;
    }
    if (rc == 0) {
      result.timedOut = true;
      break;
    }

    ssize_t n = ::read(readEnd.fd, temp, sizeof(temp));
    if (n > 0) {
      result.output.append(temp, static_cast<std::size_t>(n));
    } else if (n == 0) {
      break; // EOF, child closed its side
    } else if (errno == EINTR || errno == EAGAIN) {
      continue; // transient → retry
    } else {
      std::cerr << "read: " << strerror(errno) << '\n';
      break;
    }
  }

  if (result.timedOut)
    ::kill(pid, SIGKILL);

  int code = waitChild(pid);
  result.exitCode = result.timedOut ? -1 : code;
  return result;
}
