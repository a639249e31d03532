#include "sessionsync/common/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <sstream>

#ifndef _WIN32
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace sessionsync::common {

Result<CommandOutput> run_command(const std::string &command,
                                  const std::vector<std::string> &args,
                                  const std::optional<std::string> &input) {
#ifdef _WIN32
  (void)command;
  (void)args;
  (void)input;
  return Result<CommandOutput>::failure("subprocess execution is not supported on this platform");
#else
  int out_pipe[2] = {-1, -1};
  int in_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    return Result<CommandOutput>::failure("failed to create pipe");
  }
  if (pipe(in_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    return Result<CommandOutput>::failure("failed to create pipe");
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(in_pipe[0]);
    close(in_pipe[1]);
    return Result<CommandOutput>::failure("failed to fork process");
  }

  if (pid == 0) {
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(out_pipe[1], STDERR_FILENO);
    close(in_pipe[0]);
    close(in_pipe[1]);
    close(out_pipe[0]);
    close(out_pipe[1]);

    std::vector<char *> cargs;
    cargs.reserve(args.size() + 2);
    cargs.push_back(const_cast<char *>(command.c_str()));
    for (const auto &arg : args) {
      cargs.push_back(const_cast<char *>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    execvp(command.c_str(), cargs.data());
    _exit(127);
  }

  close(in_pipe[0]);
  close(out_pipe[1]);

  if (input.has_value()) {
    // The child may exit without reading; ignore SIGPIPE for the write.
    struct sigaction ignore {};
    struct sigaction previous {};
    ignore.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &ignore, &previous);

    std::size_t written = 0;
    while (written < input->size()) {
      const ssize_t n = write(in_pipe[1], input->data() + written, input->size() - written);
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n <= 0) {
        break;
      }
      written += static_cast<std::size_t>(n);
    }
    sigaction(SIGPIPE, &previous, nullptr);
  }
  close(in_pipe[1]);

  CommandOutput result;
  char buffer[512] = {0};
  while (true) {
    const ssize_t n = read(out_pipe[0], buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    result.output.append(buffer, static_cast<std::size_t>(n));
  }
  close(out_pipe[0]);

  int status = 0;
  pid_t waited = 0;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited <= 0) {
    return Result<CommandOutput>::failure("failed to wait for " + command);
  }
  if (!WIFEXITED(status)) {
    return Result<CommandOutput>::failure(command + " terminated abnormally");
  }
  result.exit_code = WEXITSTATUS(status);
  if (result.exit_code == 127) {
    return Result<CommandOutput>::failure("command not found: " + command);
  }
  return Result<CommandOutput>::success(std::move(result));
#endif
}

bool command_exists(const std::string &command) {
  const char *path = std::getenv("PATH");
  if (path == nullptr) {
    return false;
  }
#ifdef _WIN32
  const char separator = ';';
#else
  const char separator = ':';
#endif
  std::stringstream stream(path);
  std::string dir;
  while (std::getline(stream, dir, separator)) {
    if (dir.empty()) {
      continue;
    }
    std::error_code ec;
    const auto candidate = std::filesystem::path(dir) / command;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return true;
    }
  }
  return false;
}

} // namespace sessionsync::common
