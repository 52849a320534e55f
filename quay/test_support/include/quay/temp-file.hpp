#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace quay::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "quay-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Creates (or overwrites) the file at 'relPath' below the directory, creating intermediate directories.
  // Returns its full path.
  std::filesystem::path writeFile(std::string_view relPath, std::string_view content) const;

  // Creates a file of given size filled with a repeating pattern starting from 'a', and returns its content.
  std::string writeFile(std::string_view relPath, std::uint64_t size) const;

  // Creates the directory at 'relPath' (and its parents). Returns its full path.
  std::filesystem::path makeDir(std::string_view relPath) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

}  // namespace quay::test
