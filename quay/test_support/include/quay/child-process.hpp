#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quay/base-fd.hpp"
#include "quay/timedef.hpp"

namespace quay::test {
using namespace std::chrono_literals;

// Runs an executable in a child process whose standard output is captured through a pipe.
// Standard error is inherited. The child is killed (SIGKILL) and reaped on destruction if still running.
class ChildProcess {
 public:
  struct Options {
    // Environment changes applied on top of the current environment. A std::nullopt value unsets the variable.
    std::vector<std::pair<std::string, std::optional<std::string>>> env;
    // Working directory of the child, current one if empty.
    std::filesystem::path workingDir;
  };

  // Throws std::system_error if the process cannot be spawned.
  ChildProcess(const std::filesystem::path& executable, const Options& options);

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess(ChildProcess&&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;
  ChildProcess& operator=(ChildProcess&&) = delete;

  ~ChildProcess();

  [[nodiscard]] pid_t pid() const noexcept { return _pid; }

  // Sends given signal to the child. Returns false if it is not running anymore.
  bool signal(int sigNum) const noexcept;

  // Waits for the child to exit and returns its exit code (128 + signal number if killed by a signal).
  // Returns std::nullopt if it is still running at timeout.
  std::optional<int> wait(std::chrono::milliseconds timeout = 10s);

  // Waits until the captured output contains 'needle'. Returns false on timeout or end of output.
  bool waitForOutput(std::string_view needle, std::chrono::milliseconds timeout = 5s);

  // Output captured so far, after reading what is immediately available.
  const std::string& output();

  // Complete lines of output captured so far.
  std::vector<std::string> outputLines();

 private:
  // Appends the child output, waiting until 'deadline' for the first bytes.
  void readOutput(SteadyTimePoint deadline);

  BaseFd _stdout;
  std::string _output;
  pid_t _pid{-1};
  std::optional<int> _exitCode;
  bool _eof{false};
};

}  // namespace quay::test
