#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace quay {

/// A typed key / value attached to a log record.
/// Durations are serialized as integer nanoseconds.
class LogField {
 public:
  using Value = std::variant<std::string_view, int64_t, uint64_t, std::chrono::nanoseconds>;

  LogField(std::string_view key, std::string_view value) noexcept : _key(key), _value(value) {}
  LogField(std::string_view key, const char *value) noexcept : _key(key), _value(std::string_view(value)) {}
  LogField(std::string_view key, const std::string &value) noexcept : _key(key), _value(std::string_view(value)) {}

  template <std::signed_integral T>
  LogField(std::string_view key, T value) noexcept : _key(key), _value(static_cast<int64_t>(value)) {}

  template <std::unsigned_integral T>
  LogField(std::string_view key, T value) noexcept : _key(key), _value(static_cast<uint64_t>(value)) {}

  template <class Rep, class Period>
  LogField(std::string_view key, std::chrono::duration<Rep, Period> value) noexcept
      : _key(key), _value(std::chrono::duration_cast<std::chrono::nanoseconds>(value)) {}

  [[nodiscard]] std::string_view key() const noexcept { return _key; }

  [[nodiscard]] const Value &value() const noexcept { return _value; }

 private:
  std::string_view _key;
  Value _value;
};

/// Emits one JSON object per line:
///   {"time":"2025-01-01T00:00:00.000Z","level":"INFO","msg":"...",<fields in call order>}
/// It is a thin value type around a spdlog logger (shared), cheap to copy and safe to use from several threads.
/// There is no process-wide default instance: every component receives the logger it writes to.
class StructuredLogger {
 public:
  enum class Level : uint8_t { Debug, Info, Warn, Error };

  /// Logger writing to standard output.
  static StructuredLogger Stdout(Level minLevel = Level::Info);

  /// Logger writing to given stream. The stream must outlive the logger and all its copies.
  static StructuredLogger ToStream(std::ostream &os, Level minLevel = Level::Info);

  /// Logger writing to given spdlog sink. The sink pattern is replaced by "%v".
  static StructuredLogger ToSink(spdlog::sink_ptr sink, Level minLevel = Level::Info);

  explicit StructuredLogger(std::shared_ptr<spdlog::logger> logger) noexcept : _logger(std::move(logger)) {}

  void log(Level level, std::string_view msg, std::initializer_list<LogField> fields = {}) const;

  void debug(std::string_view msg, std::initializer_list<LogField> fields = {}) const {
    log(Level::Debug, msg, fields);
  }
  void info(std::string_view msg, std::initializer_list<LogField> fields = {}) const { log(Level::Info, msg, fields); }
  void warn(std::string_view msg, std::initializer_list<LogField> fields = {}) const { log(Level::Warn, msg, fields); }
  void error(std::string_view msg, std::initializer_list<LogField> fields = {}) const {
    log(Level::Error, msg, fields);
  }

  [[nodiscard]] bool shouldLog(Level level) const;

  void flush() const { _logger->flush(); }

  /// Renders a record without emitting it (exposed for tests).
  static std::string Render(std::chrono::system_clock::time_point time, Level level, std::string_view msg,
                            std::initializer_list<LogField> fields);

  static std::string_view LevelName(Level level);

 private:
  std::shared_ptr<spdlog::logger> _logger;
};

/// Message of given exception, or "unknown error" if the exception is not a std::exception.
std::string ExceptionMessage(const std::exception_ptr &eptr);

}  // namespace quay
