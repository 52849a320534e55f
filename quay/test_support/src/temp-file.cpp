#include "quay/temp-file.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "quay/log.hpp"

namespace quay::test {

namespace {
std::string toHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(value >> (i * 4)) & 0xF]);
  }
  return out;
}

std::mt19937_64& threadRng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + toHex(dist(threadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = candidate;
      return;
    }
  }

  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

std::filesystem::path ScopedTempDir::writeFile(std::string_view relPath, std::string_view content) const {
  auto path = _dir / relPath;
  std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!ofs) {
    throw std::runtime_error("ScopedTempDir: failed to write " + path.string());
  }
  return path;
}

std::string ScopedTempDir::writeFile(std::string_view relPath, std::uint64_t size) const {
  std::string content(static_cast<std::size_t>(size), '\0');
  for (std::size_t pos = 0; pos < content.size(); ++pos) {
    content[pos] = static_cast<char>('a' + (pos % 26));
  }
  writeFile(relPath, std::string_view(content));
  return content;
}

std::filesystem::path ScopedTempDir::makeDir(std::string_view relPath) const {
  auto path = _dir / relPath;
  std::filesystem::create_directories(path);
  return path;
}

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir::cleanup: remove_all({}) failed: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

}  // namespace quay::test
