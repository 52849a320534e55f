#include "quay/log-capture.hpp"

#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/base_sink.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "quay/structured-logger.hpp"

namespace quay::test {

std::vector<std::string> MemorySink::lines() {
  std::lock_guard<std::mutex> lock(mutex_);
  return _lines;
}

void MemorySink::sink_it_(const spdlog::details::log_msg& msg) {
  spdlog::memory_buf_t formatted;
  formatter_->format(msg, formatted);
  std::string line(formatted.data(), formatted.size());
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  _lines.push_back(std::move(line));
}

LogCapture::LogCapture(StructuredLogger::Level minLevel)
    : _sink(std::make_shared<MemorySink>()), _logger(StructuredLogger::ToSink(_sink, minLevel)) {}

std::vector<std::string> LogCapture::withMessage(std::string_view msg) const {
  std::vector<std::string> matching;
  for (auto& line : lines()) {
    if (JsonStringField(line, "msg") == msg) {
      matching.push_back(std::move(line));
    }
  }
  return matching;
}

bool LogCapture::waitForMessage(std::string_view msg, std::size_t count, std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (withMessage(msg).size() < count) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  return true;
}

std::string_view JsonField(std::string_view line, std::string_view key) {
  std::string needle;
  needle.reserve(key.size() + 3U);
  needle.push_back('"');
  needle.append(key);
  needle.append("\":");

  // Keys are searched at top level only: skip over string contents while scanning.
  std::size_t pos = 1;
  while (pos < line.size()) {
    if (line.compare(pos, needle.size(), needle) == 0) {
      const std::size_t valueBeg = pos + needle.size();
      std::size_t valueEnd = valueBeg;
      if (valueEnd < line.size() && line[valueEnd] == '"') {
        ++valueEnd;
        while (valueEnd < line.size() && line[valueEnd] != '"') {
          valueEnd += line[valueEnd] == '\\' ? 2U : 1U;
        }
        ++valueEnd;
      } else {
        while (valueEnd < line.size() && line[valueEnd] != ',' && line[valueEnd] != '}') {
          ++valueEnd;
        }
      }
      return line.substr(valueBeg, std::min(valueEnd, line.size()) - valueBeg);
    }
    // Skip the current key and its value.
    if (line[pos] == '"') {
      ++pos;
      while (pos < line.size() && line[pos] != '"') {
        pos += line[pos] == '\\' ? 2U : 1U;
      }
    }
    ++pos;
  }
  return {};
}

std::string_view JsonStringField(std::string_view line, std::string_view key) {
  auto value = JsonField(line, key);
  if (value.size() >= 2U && value.front() == '"' && value.back() == '"') {
    value.remove_prefix(1);
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace quay::test
