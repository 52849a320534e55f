#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

#include "quay/errno-throw.hpp"
#include "quay/log.hpp"

namespace quay::test {

// Sets (or unsets, when given std::nullopt) an environment variable for the lifetime of the object,
// restoring its previous state afterwards.
class ScopedEnvVar {
 public:
  ScopedEnvVar(std::string name, const std::optional<std::string>& value) : _name(std::move(name)) {
    if (const char* prev = std::getenv(_name.c_str()); prev != nullptr) {
      _previous = prev;
    }
    if (apply(value) != 0) {
      throw_errno("ScopedEnvVar: cannot set {}", _name);
    }
  }

  ScopedEnvVar(const ScopedEnvVar&) = delete;
  ScopedEnvVar(ScopedEnvVar&&) = delete;
  ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;
  ScopedEnvVar& operator=(ScopedEnvVar&&) = delete;

  ~ScopedEnvVar() {
    if (apply(_previous) != 0) {
      log::error("ScopedEnvVar: cannot restore {}", _name);
    }
  }

 private:
  [[nodiscard]] int apply(const std::optional<std::string>& value) const {
    return value ? ::setenv(_name.c_str(), value->c_str(), 1) : ::unsetenv(_name.c_str());
  }

  std::string _name;
  std::optional<std::string> _previous;
};

}  // namespace quay::test
