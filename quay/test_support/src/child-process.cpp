#include "quay/child-process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "quay/errno-throw.hpp"
#include "quay/log.hpp"
#include "quay/socket-ops.hpp"
#include "quay/timedef.hpp"

extern char** environ;

namespace quay::test {

namespace {

std::vector<std::string> BuildEnvironment(const ChildProcess::Options& options) {
  std::vector<std::string> env;
  for (char** entry = environ; *entry != nullptr; ++entry) {
    env.emplace_back(*entry);
  }
  for (const auto& [name, value] : options.env) {
    const std::string prefix = name + "=";
    std::erase_if(env, [&prefix](const std::string& entry) { return entry.starts_with(prefix); });
    if (value) {
      env.push_back(prefix + *value);
    }
  }
  return env;
}

}  // namespace

ChildProcess::ChildProcess(const std::filesystem::path& executable, const Options& options) {
  // Everything the child needs is prepared before fork(): only async-signal-safe calls are made in the child.
  const std::string exePath = executable.string();
  const std::string workingDir = options.workingDir.string();
  std::vector<std::string> env = BuildEnvironment(options);
  std::vector<char*> envp;
  envp.reserve(env.size() + 1U);
  for (auto& entry : env) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);
  std::string arg0 = exePath;
  char* argv[] = {arg0.data(), nullptr};

  int pipeFds[2];
  if (::pipe2(pipeFds, O_CLOEXEC) != 0) {
    throw_errno("pipe2");
  }
  BaseFd readEnd(pipeFds[0]);
  BaseFd writeEnd(pipeFds[1]);

  _pid = ::fork();
  if (_pid == -1) {
    throw_errno("fork");
  }
  if (_pid == 0) {
    if (::dup2(writeEnd.fd(), STDOUT_FILENO) == -1 || (!workingDir.empty() && ::chdir(workingDir.c_str()) != 0)) {
      ::_exit(127);
    }
    // Signals blocked by the parent thread would stay blocked in the child.
    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::execve(exePath.c_str(), argv, envp.data());
    ::_exit(127);
  }
  _stdout = std::move(readEnd);
  log::debug("Spawned {} with pid {}", exePath, _pid);
}

ChildProcess::~ChildProcess() {
  if (_pid > 0 && !_exitCode) {
    if (::kill(_pid, SIGKILL) != 0) {
      log::error("Unable to kill pid {}: {}", _pid, std::strerror(errno));
    }
    int status = 0;
    if (::waitpid(_pid, &status, 0) == -1) {
      log::error("Unable to reap pid {}: {}", _pid, std::strerror(errno));
    }
  }
}

bool ChildProcess::signal(int sigNum) const noexcept { return !_exitCode && ::kill(_pid, sigNum) == 0; }

std::optional<int> ChildProcess::wait(std::chrono::milliseconds timeout) {
  const auto deadline = SteadyClock::now() + timeout;
  while (!_exitCode) {
    int status = 0;
    const pid_t ret = ::waitpid(_pid, &status, WNOHANG);
    if (ret == -1 && errno != EINTR) {
      throw_errno("waitpid {}", _pid);
    }
    if (ret == _pid) {
      _exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
      break;
    }
    if (SteadyClock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(5ms);
  }
  return _exitCode;
}

bool ChildProcess::waitForOutput(std::string_view needle, std::chrono::milliseconds timeout) {
  const auto deadline = SteadyClock::now() + timeout;
  while (!_output.contains(needle)) {
    if (_eof || SteadyClock::now() >= deadline) {
      return false;
    }
    readOutput(deadline);
  }
  return true;
}

const std::string& ChildProcess::output() {
  readOutput(SteadyClock::now());
  return _output;
}

std::vector<std::string> ChildProcess::outputLines() {
  std::vector<std::string> lines;
  std::string_view remaining = output();
  for (auto pos = remaining.find('\n'); pos != std::string_view::npos; pos = remaining.find('\n')) {
    lines.emplace_back(remaining.substr(0, pos));
    remaining.remove_prefix(pos + 1);
  }
  return lines;
}

void ChildProcess::readOutput(SteadyTimePoint deadline) {
  char buf[4096];
  // Polls at least once, then keeps draining what is immediately available.
  auto waitUntil = std::max(deadline, SteadyClock::now() + 1ms);
  while (!_eof && WaitReadable(_stdout.fd(), waitUntil) == WaitResult::Ready) {
    const auto nbRead = ::read(_stdout.fd(), buf, sizeof(buf));
    if (nbRead == -1 && errno == EINTR) {
      continue;
    }
    if (nbRead <= 0) {
      _eof = true;
      break;
    }
    _output.append(buf, static_cast<std::size_t>(nbRead));
    waitUntil = SteadyClock::now() + 1ms;
  }
}

}  // namespace quay::test
