// Repository: ClipForge-render
// Component: Subprocess Runner
// Purpose: Runs external tools (ffmpeg, ffprobe, curl) and captures their output.
// Copyright (c) 2025 ClipForge

#include "clipforge/util/ProcessRunner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "clipforge/util/Logger.hpp"

namespace clipforge::util {

namespace {

void CloseFd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

}  // namespace

std::string JoinCommand(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out += ' ';
    if (arg.find_first_of(" \t'\"") != std::string::npos) {
      out += '\'' + arg + '\'';
    } else {
      out += arg;
    }
  }
  return out;
}

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv) const {
  ProcessResult result;
  if (argv.empty()) {
    result.stderr_text = "empty command";
    return result;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
    result.stderr_text = std::string("pipe failed: ") + std::strerror(errno);
    CloseFd(out_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[0]);
    CloseFd(err_pipe[1]);
    return result;
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    result.stderr_text = std::string("fork failed: ") + std::strerror(errno);
    CloseFd(out_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[0]);
    CloseFd(err_pipe[1]);
    return result;
  }

  if (pid == 0) {
    // Child: wire pipes, detach stdin, exec.
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    execvp(c_argv[0], c_argv.data());
    const std::string msg = std::string("exec ") + c_argv[0] + " failed: " +
                            std::strerror(errno) + "\n";
    ssize_t ignored = write(STDERR_FILENO, msg.data(), msg.size());
    (void)ignored;
    _exit(127);
  }

  result.launched = true;
  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);

  // Drain both pipes until EOF so a chatty child never blocks on a full pipe.
  char buf[4096];
  while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
    struct pollfd fds[2];
    nfds_t nfds = 0;
    int* owners[2] = {nullptr, nullptr};
    std::string* sinks[2] = {nullptr, nullptr};
    if (out_pipe[0] >= 0) {
      fds[nfds] = {out_pipe[0], POLLIN, 0};
      owners[nfds] = &out_pipe[0];
      sinks[nfds] = &result.stdout_text;
      ++nfds;
    }
    if (err_pipe[0] >= 0) {
      fds[nfds] = {err_pipe[0], POLLIN, 0};
      owners[nfds] = &err_pipe[0];
      sinks[nfds] = &result.stderr_text;
      ++nfds;
    }

    const int ready = poll(fds, nfds, -1);
    if (ready < 0) {
      if (errno == EINTR) continue;
      Logger::Warn(std::string("[ProcessRunner] poll failed: ") + std::strerror(errno));
      break;
    }

    for (nfds_t i = 0; i < nfds; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
      const ssize_t n = read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) {
        sinks[i]->append(buf, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        CloseFd(*owners[i]);
      }
    }
  }
  CloseFd(out_pipe[0]);
  CloseFd(err_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.stderr_text += std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

}  // namespace clipforge::util
