#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>

#include "quay/lifecycle-controller.hpp"
#include "quay/server-config.hpp"
#include "quay/structured-logger.hpp"

int main() {
  // Standard output only carries the JSON records, internal diagnostics go to standard error.
  spdlog::set_default_logger(spdlog::stderr_logger_mt("quay-diagnostics"));
  spdlog::set_level(spdlog::level::warn);

  const quay::StructuredLogger logger = quay::StructuredLogger::Stdout();
  int exitCode = EXIT_FAILURE;
  try {
    quay::LifecycleController controller(quay::ServerConfig::FromEnvironment(), logger);
    exitCode = controller.run();
  } catch (const std::exception& ex) {
    logger.error("Fatal error", {{"error", ex.what()}});
  }
  logger.flush();
  spdlog::default_logger_raw()->flush();
  // Connection threads left running by a forced shutdown or an accept failure still use the loggers:
  // static destructors are skipped.
  std::quick_exit(exitCode);
}
