#pragma once

#include <cstddef>
#include <string>

namespace quay {

/// Configuration knobs for StaticFileHandler.
class StaticFileConfig {
 public:
  /// Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;

  /// Name of the file served when the target path resolves to a directory.
  std::string defaultIndex{"index.html"};

  /// Whether byte-range requests are honored (RFC 7233 single range).
  bool enableRange{true};

  /// Whether conditional headers (If-Match, If-None-Match, If-Modified-Since, ...) are processed.
  bool enableConditional{true};

  /// Emit Last-Modified header.
  bool addLastModified{true};

  /// Emit a strong ETag derived from file size and modification time.
  bool addEtag{true};

  /// Whether directories without index file are rendered as an HTML listing (403 otherwise).
  bool enableDirectoryListing{true};

  /// Whether dotfiles are served and listed.
  bool showHiddenFiles{true};

  /// Guard against pathological directories (0 means no limit).
  std::size_t maxEntriesToList{10000};

  /// Size of the chunks read from disk and handed to the response writer.
  std::size_t readChunkSize{32UL * 1024UL};
};

}  // namespace quay
