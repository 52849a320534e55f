#pragma once

#include <filesystem>
#include <string_view>

#include "quay/file.hpp"
#include "quay/http-handler.hpp"
#include "quay/http-request.hpp"
#include "quay/response-writer.hpp"
#include "quay/static-file-config.hpp"
#include "quay/structured-logger.hpp"

namespace quay {

// Serves files from a fixed root directory with RFC 7232 (conditional requests) / RFC 7233 (single range) semantics.
// Only GET and HEAD are served.
//
// The request path is cleaned lexically before being mapped below the root, so that it can never escape it.
// - directory requested without a trailing slash -> 301 to 'dir/'
// - file requested with a trailing slash          -> 301 to '../file'
// - directory -> its index file if present, otherwise an HTML listing (directories first)
// - missing file -> 404, permission denied -> 403, other file system errors -> 500
// The root does not need to exist when the handler is constructed, it is only accessed per request.
class StaticFileHandler final : public HttpHandler {
 public:
  StaticFileHandler(std::filesystem::path rootDirectory, StaticFileConfig config, StructuredLogger logger);

  void serve(const HttpRequest& request, ResponseWriter& writer) const override;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return _root; }

 private:
  void serveDirectory(const HttpRequest& request, ResponseWriter& writer, const std::filesystem::path& dirPath,
                      const File& dir) const;

  void serveContent(const HttpRequest& request, ResponseWriter& writer, std::string_view name,
                    const File& file) const;

  std::filesystem::path _root;
  StaticFileConfig _config;
  StructuredLogger _logger;
};

}  // namespace quay
