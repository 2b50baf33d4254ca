// src/exec/ProcessRunner.cpp

#include "ProcessRunner.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring> // strerror
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// exit code reported when the program could not be exec'd, same as the shell
constexpr int EXEC_FAILED = 127;

struct Pipe {
  int fds[2] = {-1, -1};

  Pipe() {
    if (pipe(fds) < 0) {
      throw std::system_error(errno, std::generic_category(), "pipe");
    }
  }
  ~Pipe() {
    closeRead();
    closeWrite();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  int readEnd() const { return fds[0]; }
  int writeEnd() const { return fds[1]; }

  void closeRead() {
    if (fds[0] >= 0) {
      close(fds[0]);
      fds[0] = -1;
    }
  }
  void closeWrite() {
    if (fds[1] >= 0) {
      close(fds[1]);
      fds[1] = -1;
    }
  }
};

std::vector<std::string> buildArgv(const Command &command) {
  if (command.usesShell()) {
    return {"/bin/sh", "-c", command.script()};
  }
  return command.argv();
}

// drain both pipes until the child closes them
void collectOutput(Pipe &out_pipe, Pipe &err_pipe, ProcessResult &result) {
  pollfd fds[2] = {{out_pipe.readEnd(), POLLIN, 0},
                   {err_pipe.readEnd(), POLLIN, 0}};
  std::string *sinks[2] = {&result.out, &result.err};
  int open_fds = 2;
  char buffer[4096];

  while (open_fds > 0) {
    if (poll(fds, 2, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "poll");
    }

    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      const ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        sinks[i]->append(buffer, static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        // EOF or hard error: stop watching this descriptor
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
}

} // namespace

ProcessResult SystemProcessRunner::execute(const Command &command) {
  const std::vector<std::string> args = buildArgv(command);
  if (args.empty()) {
    throw std::invalid_argument("Cannot execute an empty command");
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  Pipe out_pipe;
  Pipe err_pipe;

  const pid_t pid = fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }

  if (pid == 0) {
    // child: wire the pipes to stdout/stderr and replace the image
    dup2(out_pipe.writeEnd(), STDOUT_FILENO);
    dup2(err_pipe.writeEnd(), STDERR_FILENO);
    out_pipe.closeRead();
    err_pipe.closeRead();
    out_pipe.closeWrite();
    err_pipe.closeWrite();

    execvp(argv[0], argv.data());
    const std::string message =
        std::string(argv[0]) + ": " + strerror(errno) + "\n";
    (void)!write(STDERR_FILENO, message.data(), message.size());
    _exit(EXEC_FAILED);
  }

  out_pipe.closeWrite();
  err_pipe.closeWrite();

  ProcessResult result;
  collectOutput(out_pipe, err_pipe, result);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }
  return result;
}

bool SystemProcessRunner::commandExists(const std::string &name) const {
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0;
  }

  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return false;
  }

  std::istringstream paths(path_env);
  std::string dir;
  while (std::getline(paths, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = dir + "/" + name;
    if (access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

bool SystemProcessRunner::pathExists(const std::string &path) const {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}
