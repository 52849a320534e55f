#pragma once

#include <spdlog/sinks/base_sink.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "quay/structured-logger.hpp"

namespace quay::test {

// spdlog sink keeping each formatted record (without line ending) in memory.
class MemorySink final : public spdlog::sinks::base_sink<std::mutex> {
 public:
  [[nodiscard]] std::vector<std::string> lines();

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override;

  void flush_() override {}

 private:
  std::vector<std::string> _lines;
};

// Captures the records emitted through a StructuredLogger, safe to inspect while other threads are logging.
class LogCapture {
 public:
  explicit LogCapture(StructuredLogger::Level minLevel = StructuredLogger::Level::Debug);

  [[nodiscard]] const StructuredLogger& logger() const noexcept { return _logger; }

  [[nodiscard]] std::vector<std::string> lines() const { return _sink->lines(); }

  // Records whose "msg" equals given message.
  [[nodiscard]] std::vector<std::string> withMessage(std::string_view msg) const;

  // Waits until at least 'count' records with given message have been emitted, or the timeout expires.
  bool waitForMessage(std::string_view msg, std::size_t count = 1,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds{2000}) const;

 private:
  std::shared_ptr<MemorySink> _sink;
  StructuredLogger _logger;
};

// Raw JSON text of the value of top-level key 'key' in a single-line JSON object, or an empty string_view if absent.
// Strings are returned with their quotes: JsonField(R"({"a":"x","b":2})", "b") == "2".
[[nodiscard]] std::string_view JsonField(std::string_view line, std::string_view key);

// Unquoted value of a string field (escapes are not decoded).
[[nodiscard]] std::string_view JsonStringField(std::string_view line, std::string_view key);

}  // namespace quay::test
