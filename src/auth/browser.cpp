#include "sessionsync/auth/browser.hpp"

#include "sessionsync/observability/global.hpp"

#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <process.h>
#else
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace sessionsync::auth {

std::string escape_cmd_argument(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    switch (c) {
    case '&':
    case '|':
    case '<':
    case '>':
    case '^':
    case '(':
    case ')':
      out.push_back('^');
      break;
    default:
      break;
    }
    out.push_back(c);
  }
  return out;
}

std::vector<std::string> SystemBrowserLauncher::windows_start_command(const std::string &url) {
  // _spawnvp drops empty arguments, so the empty window title is passed as literal quotes.
  return {"cmd", "/c", "start", "\"\"", escape_cmd_argument(url)};
}

std::vector<std::string> SystemBrowserLauncher::command_for(const std::string &url) {
#if defined(_WIN32)
  return windows_start_command(url);
#elif defined(__APPLE__)
  return {"open", url};
#else
  return {"xdg-open", url};
#endif
}

common::Status SystemBrowserLauncher::open(const std::string &url) {
  const auto command = command_for(url);

#ifdef _WIN32
  std::vector<const char *> cargs;
  cargs.reserve(command.size() + 1);
  for (const auto &arg : command) {
    cargs.push_back(arg.c_str());
  }
  cargs.push_back(nullptr);
  if (_spawnvp(_P_DETACH, cargs[0], cargs.data()) < 0) {
    return common::Status::error("failed to launch browser: " + std::string(std::strerror(errno)));
  }
  return common::Status::success();
#else
  // The exec-status pipe is close-on-exec: EOF means the launcher started,
  // an errno written by the grandchild means it could not be executed.
  int pipefd[2] = {-1, -1};
  if (pipe(pipefd) != 0) {
    return common::Status::error("failed to create pipe");
  }
  fcntl(pipefd[1], F_SETFD, FD_CLOEXEC);

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipefd[0]);
    close(pipefd[1]);
    return common::Status::error("failed to fork process");
  }

  if (pid == 0) {
    close(pipefd[0]);
    const pid_t grandchild = fork();
    if (grandchild != 0) {
      _exit(grandchild < 0 ? 1 : 0);
    }

    setsid();
    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
      dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) {
        close(devnull);
      }
    }

    std::vector<char *> cargs;
    cargs.reserve(command.size() + 1);
    for (const auto &arg : command) {
      cargs.push_back(const_cast<char *>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    execvp(cargs[0], cargs.data());
    const int exec_errno = errno;
    (void)!write(pipefd[1], &exec_errno, sizeof(exec_errno));
    _exit(127);
  }

  close(pipefd[1]);

  int status = 0;
  waitpid(pid, &status, 0);

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = read(pipefd[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close(pipefd[0]);

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    return common::Status::error("failed to fork browser launcher");
  }
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    return common::Status::error("failed to run " + command.front() + ": " +
                                 std::strerror(exec_errno));
  }

  observability::log_debug("oauth", "launched browser via " + command.front());
  return common::Status::success();
#endif
}

} // namespace sessionsync::auth
