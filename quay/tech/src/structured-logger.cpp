#include "quay/structured-logger.hpp"

#include <glaze/glaze.hpp>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "quay/timedef.hpp"
#include "quay/timestring.hpp"

namespace quay {

namespace {

using JsonValue = std::variant<std::string_view, int64_t, uint64_t>;
using JsonRecord = std::vector<std::pair<std::string_view, JsonValue>>;

// Durations are written as integer nanoseconds.
struct ToJsonValue {
  JsonValue operator()(std::chrono::nanoseconds value) const noexcept { return static_cast<int64_t>(value.count()); }

  template <class T>
  JsonValue operator()(T value) const noexcept {
    return value;
  }
};

constexpr spdlog::level::level_enum ToSpdlogLevel(StructuredLogger::Level level) {
  switch (level) {
    case StructuredLogger::Level::Debug:
      return spdlog::level::debug;
    case StructuredLogger::Level::Info:
      return spdlog::level::info;
    case StructuredLogger::Level::Warn:
      return spdlog::level::warn;
    default:
      return spdlog::level::err;
  }
}

std::shared_ptr<spdlog::logger> MakeLogger(std::string name, spdlog::sink_ptr sink, StructuredLogger::Level minLevel) {
  // The record is fully rendered by StructuredLogger, spdlog only adds the line ending.
  sink->set_pattern("%v");
  auto logger = std::make_shared<spdlog::logger>(std::move(name), std::move(sink));
  logger->set_level(ToSpdlogLevel(minLevel));
  logger->flush_on(spdlog::level::debug);
  return logger;
}

}  // namespace

StructuredLogger StructuredLogger::Stdout(Level minLevel) {
  return StructuredLogger(MakeLogger("quay", std::make_shared<spdlog::sinks::stdout_sink_mt>(), minLevel));
}

StructuredLogger StructuredLogger::ToStream(std::ostream &os, Level minLevel) {
  return StructuredLogger(MakeLogger("quay-stream", std::make_shared<spdlog::sinks::ostream_sink_mt>(os), minLevel));
}

StructuredLogger StructuredLogger::ToSink(spdlog::sink_ptr sink, Level minLevel) {
  return StructuredLogger(MakeLogger("quay-sink", std::move(sink), minLevel));
}

std::string_view StructuredLogger::LevelName(Level level) {
  switch (level) {
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warn:
      return "WARN";
    default:
      return "ERROR";
  }
}

bool StructuredLogger::shouldLog(Level level) const { return _logger->should_log(ToSpdlogLevel(level)); }

void StructuredLogger::log(Level level, std::string_view msg, std::initializer_list<LogField> fields) const {
  if (!shouldLog(level)) {
    return;
  }
  const std::string record = Render(SysClock::now(), level, msg, fields);
  _logger->log(ToSpdlogLevel(level), std::string_view(record));
}

std::string StructuredLogger::Render(SysTimePoint time, Level level, std::string_view msg,
                                     std::initializer_list<LogField> fields) {
  char timeBuf[kISO8601WithMsStrLen];
  TimeToStringISO8601UTCWithMs(time, timeBuf);

  // A range of key / value pairs is written by glaze as a single JSON object, keys kept in insertion order.
  JsonRecord record;
  record.reserve(3U + fields.size());
  record.emplace_back("time", std::string_view(timeBuf, sizeof(timeBuf)));
  record.emplace_back("level", LevelName(level));
  record.emplace_back("msg", msg);
  for (const LogField &field : fields) {
    record.emplace_back(field.key(), std::visit(ToJsonValue{}, field.value()));
  }
  return glz::write_json(record).value_or(std::string{});
}

std::string ExceptionMessage(const std::exception_ptr &eptr) {
  try {
    std::rethrow_exception(eptr);
  } catch (const std::exception &ex) {
    return ex.what();
  } catch (...) {
    return "unknown error";
  }
}

}  // namespace quay
