#pragma once

// Internal diagnostics (fd lifecycle, unexpected syscall failures) go through spdlog's default logger.
// Request and lifecycle records are emitted by quay::StructuredLogger, which is always passed explicitly.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace quay {
namespace log = spdlog;
}  // namespace quay
