#include "quay/static-file-handler.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "quay/content-sniff.hpp"
#include "quay/file.hpp"
#include "quay/http-constants.hpp"
#include "quay/http-headers.hpp"
#include "quay/http-request.hpp"
#include "quay/http-status-code.hpp"
#include "quay/mime-mappings.hpp"
#include "quay/path-clean.hpp"
#include "quay/response-writer.hpp"
#include "quay/static-file-config.hpp"
#include "quay/string-trim.hpp"
#include "quay/structured-logger.hpp"
#include "quay/timedef.hpp"
#include "quay/timestring.hpp"
#include "quay/url-encode.hpp"

namespace quay {
namespace {

// Result of the evaluation of one conditional header.
enum class Cond : uint8_t { None, True, False };

[[nodiscard]] bool IsHiddenName(std::string_view name) { return !name.empty() && name.front() == '.'; }

[[nodiscard]] bool IsZeroTime(SysTimePoint tp) { return tp == SysTimePoint{}; }

[[nodiscard]] std::string FormatHttpDate(SysTimePoint tp) {
  std::array<char, kRFC7231DateStrLen> buf;
  TimeToStringRFC7231(tp, buf.data());
  return {buf.data(), buf.size()};
}

// Strong ETag derived from file size and modification time: "<size hex>-<mtime ns hex>".
[[nodiscard]] std::string MakeStrongEtag(uint64_t fileSize, SysTimePoint lastModified) {
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(lastModified.time_since_epoch()).count();
  return fmt::format("\"{:x}-{:x}\"", fileSize, static_cast<uint64_t>(nanos));
}

// Last element of a slash separated path, ignoring trailing slashes.
[[nodiscard]] std::string_view PathBase(std::string_view path) {
  while (path.size() > 1U && path.back() == '/') {
    path.remove_suffix(1);
  }
  if (path.empty()) {
    return ".";
  }
  if (path == "/") {
    return path;
  }
  const auto slashPos = path.rfind('/');
  return slashPos == std::string_view::npos ? path : path.substr(slashPos + 1);
}

[[nodiscard]] http::StatusCode StatusFromErrno(int err) {
  switch (err) {
    case ENOENT:
    case ENOTDIR:
      return http::StatusCodeNotFound;
    case EACCES:
    case EPERM:
      return http::StatusCodeForbidden;
    default:
      return http::StatusCodeInternalServerError;
  }
}

// Plain text error response. Validators set for the content are dropped as they do not describe the error body.
void ServeError(ResponseWriter& writer, http::StatusCode code, std::string_view msg) {
  HttpHeaders& headers = writer.headers();
  headers.erase(http::ContentLength);
  headers.erase(http::ETag);
  headers.erase(http::LastModified);
  headers.erase(http::CacheControl);
  headers.set(http::ContentType, http::ContentTypeTextPlain);
  headers.set(http::XContentTypeOptions, "nosniff");
  writer.writeHeader(code);

  std::string body(msg);
  body.push_back('\n');
  writer.write(body);
}

void ServeError(ResponseWriter& writer, http::StatusCode code) {
  if (code == http::StatusCodeNotFound) {
    ServeError(writer, code, "404 page not found");
  } else {
    ServeError(writer, code, fmt::format("{} {}", code, http::ReasonPhrase(code)));
  }
}

// Redirects to 'newPath', relative to the current request path, keeping the query string.
void LocalRedirect(const HttpRequest& request, ResponseWriter& writer, std::string_view newPath) {
  std::string location;
  AppendURLEncoded(newPath, IsPathChar, location);
  if (!request.rawQuery().empty()) {
    location.push_back('?');
    location.append(request.rawQuery());
  }
  writer.headers().set(http::Location, location);
  writer.writeHeader(http::StatusCodeMovedPermanently);
}

void WriteNotModified(ResponseWriter& writer) {
  HttpHeaders& headers = writer.headers();
  headers.erase(http::ContentType);
  headers.erase(http::ContentLength);
  if (headers.contains(http::ETag)) {
    headers.erase(http::LastModified);
  }
  writer.writeHeader(http::StatusCodeNotModified);
}

// Splits the leading entity-tag (optionally weak) off 's'.
// Returns an empty etag if 's' does not start with a well formed one.
[[nodiscard]] std::pair<std::string_view, std::string_view> ScanETag(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  const std::size_t start = s.starts_with("W/") ? 2U : 0U;
  if (s.size() < start + 2U || s[start] != '"') {
    return {};
  }
  for (std::size_t pos = start + 1U; pos < s.size(); ++pos) {
    const auto uc = static_cast<unsigned char>(s[pos]);
    if (uc == '"') {
      return {s.substr(0, pos + 1U), s.substr(pos + 1U)};
    }
    if (uc != 0x21U && (uc < 0x23U || uc > 0x7EU) && uc < 0x80U) {
      break;
    }
  }
  return {};
}

[[nodiscard]] bool EtagStrongMatch(std::string_view lhs, std::string_view rhs) {
  return lhs == rhs && !lhs.empty() && lhs.front() == '"';
}

[[nodiscard]] bool EtagWeakMatch(std::string_view lhs, std::string_view rhs) {
  if (lhs.starts_with("W/")) {
    lhs.remove_prefix(2);
  }
  if (rhs.starts_with("W/")) {
    rhs.remove_prefix(2);
  }
  return lhs == rhs;
}

// Walks a comma separated list of entity-tags. '*' matches anything.
// Stops at the first malformed element.
template <class Pred>
[[nodiscard]] bool EtagListMatches(std::string_view list, Pred matches) {
  while (true) {
    list = TrimOws(list);
    if (list.empty()) {
      return false;
    }
    if (list.front() == ',') {
      list.remove_prefix(1);
      continue;
    }
    if (list.front() == '*') {
      return true;
    }
    const auto [etag, remain] = ScanETag(list);
    if (etag.empty()) {
      return false;
    }
    if (matches(etag)) {
      return true;
    }
    list = remain;
  }
}

[[nodiscard]] bool IsGetOrHead(const HttpRequest& request) {
  return request.method() == http::GET || request.method() == http::HEAD;
}

[[nodiscard]] Cond CheckIfMatch(const HttpRequest& request, std::string_view etag) {
  const auto value = TrimOws(request.headerValueOrEmpty(http::IfMatch));
  if (value.empty()) {
    return Cond::None;
  }
  return EtagListMatches(value, [etag](std::string_view tag) { return EtagStrongMatch(tag, etag); }) ? Cond::True
                                                                                                      : Cond::False;
}

[[nodiscard]] Cond CheckIfUnmodifiedSince(const HttpRequest& request, SysTimePoint lastModified) {
  const auto value = request.headerValueOrEmpty(http::IfUnmodifiedSince);
  if (value.empty() || IsZeroTime(lastModified)) {
    return Cond::None;
  }
  const auto since = TryParseTimeRFC7231(TrimOws(value));
  if (since == kInvalidTimePoint) {
    return Cond::None;
  }
  return std::chrono::floor<std::chrono::seconds>(lastModified) <= since ? Cond::True : Cond::False;
}

[[nodiscard]] Cond CheckIfNoneMatch(const HttpRequest& request, std::string_view etag) {
  const auto value = TrimOws(request.headerValueOrEmpty(http::IfNoneMatch));
  if (value.empty()) {
    return Cond::None;
  }
  return EtagListMatches(value, [etag](std::string_view tag) { return EtagWeakMatch(tag, etag); }) ? Cond::False
                                                                                                    : Cond::True;
}

[[nodiscard]] Cond CheckIfModifiedSince(const HttpRequest& request, SysTimePoint lastModified) {
  if (!IsGetOrHead(request)) {
    return Cond::None;
  }
  const auto value = request.headerValueOrEmpty(http::IfModifiedSince);
  if (value.empty() || IsZeroTime(lastModified)) {
    return Cond::None;
  }
  const auto since = TryParseTimeRFC7231(TrimOws(value));
  if (since == kInvalidTimePoint) {
    return Cond::None;
  }
  return std::chrono::floor<std::chrono::seconds>(lastModified) <= since ? Cond::False : Cond::True;
}

[[nodiscard]] Cond CheckIfRange(const HttpRequest& request, std::string_view etag, SysTimePoint lastModified) {
  if (!IsGetOrHead(request)) {
    return Cond::None;
  }
  const auto value = TrimOws(request.headerValueOrEmpty(http::IfRange));
  if (value.empty()) {
    return Cond::None;
  }
  const auto tag = ScanETag(value).first;
  if (!tag.empty()) {
    return EtagStrongMatch(tag, etag) ? Cond::True : Cond::False;
  }
  if (IsZeroTime(lastModified)) {
    return Cond::False;
  }
  const auto date = TryParseTimeRFC7231(value);
  if (date == kInvalidTimePoint) {
    return Cond::False;
  }
  return std::chrono::floor<std::chrono::seconds>(lastModified) == date ? Cond::True : Cond::False;
}

// Evaluates the preconditions of RFC 7232 section 6 in order.
// Returns true if the response is complete (304 or 412 already written).
// Otherwise 'rangeAllowed' is set to false when If-Range does not match the current representation.
[[nodiscard]] bool CheckPreconditions(const HttpRequest& request, ResponseWriter& writer, SysTimePoint lastModified,
                                      bool& rangeAllowed) {
  const std::string etag(writer.headers().getOrEmpty(http::ETag));

  Cond cond = CheckIfMatch(request, etag);
  if (cond == Cond::None) {
    cond = CheckIfUnmodifiedSince(request, lastModified);
  }
  if (cond == Cond::False) {
    writer.writeHeader(http::StatusCodePreconditionFailed);
    return true;
  }

  switch (CheckIfNoneMatch(request, etag)) {
    case Cond::False:
      if (IsGetOrHead(request)) {
        WriteNotModified(writer);
      } else {
        writer.writeHeader(http::StatusCodePreconditionFailed);
      }
      return true;
    case Cond::None:
      if (CheckIfModifiedSince(request, lastModified) == Cond::False) {
        WriteNotModified(writer);
        return true;
      }
      break;
    default:
      break;
  }

  rangeAllowed = CheckIfRange(request, etag, lastModified) != Cond::False;
  return false;
}

struct ByteRange {
  uint64_t start{0};
  uint64_t length{0};
};

enum class RangeError : uint8_t { None, Invalid, NoOverlap };

[[nodiscard]] std::optional<uint64_t> ParseUint(std::string_view token) {
  uint64_t value;
  const auto* first = token.data();
  const auto* last = first + token.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (token.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

// Parses a Range header value ("bytes=0-99,200-,-50") against a representation of 'size' bytes.
// Ranges starting past the end are skipped. If all of them are, NoOverlap is returned.
[[nodiscard]] RangeError ParseRange(std::string_view value, uint64_t size, std::vector<ByteRange>& ranges) {
  static constexpr std::string_view kBytesEqual = "bytes=";
  if (!value.starts_with(kBytesEqual)) {
    return RangeError::Invalid;
  }
  value.remove_prefix(kBytesEqual.size());

  bool noOverlap = false;
  while (true) {
    const auto commaPos = value.find(',');
    const auto spec = TrimOws(value.substr(0, commaPos));
    if (!spec.empty()) {
      const auto dashPos = spec.find('-');
      if (dashPos == std::string_view::npos) {
        return RangeError::Invalid;
      }
      const auto firstPart = TrimOws(spec.substr(0, dashPos));
      const auto lastPart = TrimOws(spec.substr(dashPos + 1));
      ByteRange range;
      if (firstPart.empty()) {
        // suffix-byte-range-spec: last N bytes
        const auto suffixLen = ParseUint(lastPart);
        if (!suffixLen) {
          return RangeError::Invalid;
        }
        if (*suffixLen == 0 || size == 0) {
          noOverlap = true;
        } else {
          range.length = std::min(*suffixLen, size);
          range.start = size - range.length;
          ranges.push_back(range);
        }
      } else {
        const auto firstPos = ParseUint(firstPart);
        if (!firstPos) {
          return RangeError::Invalid;
        }
        std::optional<uint64_t> lastPos;
        if (!lastPart.empty()) {
          lastPos = ParseUint(lastPart);
          if (!lastPos || *lastPos < *firstPos) {
            return RangeError::Invalid;
          }
        }
        if (*firstPos >= size) {
          noOverlap = true;
        } else {
          range.start = *firstPos;
          range.length = (lastPos ? std::min(*lastPos, size - 1U) : size - 1U) - range.start + 1U;
          ranges.push_back(range);
        }
      }
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }

  if (noOverlap && ranges.empty()) {
    return RangeError::NoOverlap;
  }
  return RangeError::None;
}

[[nodiscard]] bool RangesExceedSize(std::span<const ByteRange> ranges, uint64_t size) {
  uint64_t total = 0;
  for (const ByteRange& range : ranges) {
    total += range.length;
    if (total > size) {
      return true;
    }
  }
  return false;
}

struct DirectoryListingEntry {
  std::string name;
  bool isDirectory{false};
  bool sizeKnown{false};
  std::uintmax_t sizeBytes{0};
  SysTimePoint lastModified{kInvalidTimePoint};
};

struct DirectoryListingResult {
  std::vector<DirectoryListingEntry> entries;
  std::string error;
  bool truncated{false};
};

[[nodiscard]] DirectoryListingResult CollectDirectoryListing(const std::filesystem::path& directory,
                                                             const StaticFileConfig& config) {
  DirectoryListingResult result;
  const std::size_t limit =
      config.maxEntriesToList == 0U ? std::numeric_limits<std::size_t>::max() : config.maxEntriesToList;

  std::error_code ec;
  std::filesystem::directory_iterator iter(directory, ec);
  const std::filesystem::directory_iterator end;

  while (!ec && iter != end) {
    const std::filesystem::directory_entry current = *iter;
    iter.increment(ec);
    const bool hasMore = !ec && iter != end;

    std::string name = current.path().filename().string();
    if (!config.showHiddenFiles && IsHiddenName(name)) {
      continue;
    }

    DirectoryListingEntry& info = result.entries.emplace_back();
    info.name = std::move(name);

    std::error_code stepEc;
    const auto entryStatus = current.symlink_status(stepEc);
    if (!stepEc) {
      if (std::filesystem::is_directory(entryStatus)) {
        info.isDirectory = true;
      } else {
        const auto fileSize = current.file_size(stepEc);
        if (!stepEc) {
          info.sizeKnown = true;
          info.sizeBytes = fileSize;
        }
      }
    }

    const auto writeTime = current.last_write_time(stepEc);
    if (!stepEc) {
      info.lastModified =
          std::chrono::time_point_cast<SysDuration>(std::chrono::file_clock::to_sys(writeTime));
    }

    if (result.entries.size() >= limit) {
      result.truncated = hasMore;
      break;
    }
  }

  if (ec) {
    result.error = ec.message();
    return result;
  }

  std::ranges::sort(result.entries, [](const DirectoryListingEntry& lhs, const DirectoryListingEntry& rhs) {
    // Directories first
    if (lhs.isDirectory != rhs.isDirectory) {
      return lhs.isDirectory;
    }
    return lhs.name < rhs.name;
  });
  return result;
}

void AppendHtmlEscaped(std::string_view text, std::string& out) {
  for (char ch : text) {
    switch (ch) {
      case '&':
        out.append("&amp;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '"':
        out.append("&quot;");
        break;
      case '\'':
        out.append("&#39;");
        break;
      default:
        out.push_back(ch);
        break;
    }
  }
}

// Human readable size in binary units: "512 B", "1.5 KB", "12 MB".
// One decimal is printed for values below 10 in units above bytes.
void AppendFormattedSize(std::uintmax_t size, std::string& out) {
  static constexpr std::array<std::string_view, 5> kUnits{"B", "KB", "MB", "GB", "TB"};

  std::size_t unitIdx = 0;
  std::uintmax_t divisor = 1;
  for (; unitIdx + 1U < kUnits.size() && size >= divisor * 1024U; ++unitIdx) {
    divisor *= 1024U;
  }

  if (unitIdx == 0U) {
    fmt::format_to(std::back_inserter(out), "{} {}", size, kUnits[unitIdx]);
    return;
  }

  const double value = static_cast<double>(size) / static_cast<double>(divisor);
  if (value < 9.95) {
    fmt::format_to(std::back_inserter(out), "{:.1f} {}", value, kUnits[unitIdx]);
  } else {
    fmt::format_to(std::back_inserter(out), "{:.0f} {}", value, kUnits[unitIdx]);
  }
}

constexpr std::string_view kDirectoryListingCss = R"CSS(
body{font-family:system-ui,-apple-system,BlinkMacSystemFont,"Segoe UI",sans-serif;margin:2rem;}
table{border-collapse:collapse;width:100%;max-width:960px;}
th,td{padding:0.3rem 0.6rem;text-align:left;border-bottom:1px solid #e0e0e0;}
td.size,td.modified{text-align:right;font-variant-numeric:tabular-nums;}
h1{font-size:1.4rem;margin-bottom:1rem;}
#truncated{margin-top:1rem;color:#b24e00;}
a.dir::after{content:"/";}
)CSS";

// Characters kept as is in listing links. ':' is escaped so that a name cannot be mistaken for a URL scheme.
constexpr bool IsListingHrefChar(char ch) { return ch != ':' && ch != '/' && IsPathChar(ch); }

[[nodiscard]] std::string RenderDirectoryListing(std::string_view requestPath,
                                                 std::span<const DirectoryListingEntry> entries, bool truncated) {
  std::string body;
  body.reserve(2048U);

  body.append("<!doctype html>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n<title>Index of ");
  AppendHtmlEscaped(requestPath, body);
  body.append("</title>\n<style>");
  body.append(kDirectoryListingCss);
  body.append("</style>\n</head>\n<body>\n<h1>Index of ");
  AppendHtmlEscaped(requestPath, body);
  body.append(
      "</h1>\n<table>\n<thead><tr><th>Name</th><th class=\"size\">Size</th><th class=\"modified\">Last "
      "Modified</th></tr></thead>\n<tbody>\n");

  if (requestPath != "/") {
    body.append(
        "<tr><td class=\"name\"><a href=\"../\" class=\"dir\">..</a></td><td class=\"size\">-</td><td "
        "class=\"modified\">-</td></tr>\n");
  }

  std::string href;
  for (const auto& entry : entries) {
    href.clear();
    AppendURLEncoded(entry.name, IsListingHrefChar, href);
    if (entry.isDirectory) {
      href.push_back('/');
    }

    body.append(R"(<tr><td class="name"><a href=")");
    AppendHtmlEscaped(href, body);
    body.push_back('"');
    if (entry.isDirectory) {
      body.append(" class=\"dir\"");
    }
    body.push_back('>');
    AppendHtmlEscaped(entry.name, body);

    body.append("</a></td><td class=\"size\">");
    if (entry.sizeKnown && !entry.isDirectory) {
      AppendFormattedSize(entry.sizeBytes, body);
    } else {
      body.push_back('-');
    }
    body.append("</td><td class=\"modified\">");
    if (entry.lastModified == kInvalidTimePoint) {
      body.push_back('-');
    } else {
      body.append(FormatHttpDate(entry.lastModified));
    }
    body.append("</td></tr>\n");
  }

  body.append("</tbody>\n</table>\n");
  if (truncated) {
    fmt::format_to(std::back_inserter(body), "<p id=\"truncated\">Listing truncated after {} entries.</p>\n",
                   entries.size());
  }
  body.append("</body>\n</html>\n");
  return body;
}

}  // namespace

StaticFileHandler::StaticFileHandler(std::filesystem::path rootDirectory, StaticFileConfig config,
                                     StructuredLogger logger)
    : _root(std::move(rootDirectory)), _config(std::move(config)), _logger(std::move(logger)) {
  _config.validate();
  if (_root.empty()) {
    _root = ".";
  }
}

void StaticFileHandler::serve(const HttpRequest& request, ResponseWriter& writer) const {
  if (!IsGetOrHead(request)) {
    writer.headers().set(http::Allow, "GET, HEAD");
    ServeError(writer, http::StatusCodeMethodNotAllowed);
    return;
  }

  std::string_view urlPath = request.path();
  if (urlPath.empty()) {
    urlPath = "/";
  }

  const std::string name = CleanRootedPath(urlPath);
  if (!_config.showHiddenFiles && name.contains("/.")) {
    ServeError(writer, http::StatusCodeNotFound);
    return;
  }

  const std::filesystem::path fsPath = _root / std::string_view(name).substr(1);
  File file(fsPath.c_str());
  if (!file) {
    ServeError(writer, StatusFromErrno(file.error()));
    return;
  }

  if (file.isDirectory()) {
    if (!urlPath.ends_with('/')) {
      LocalRedirect(request, writer, std::string(PathBase(urlPath)) + '/');
      return;
    }
  } else if (urlPath.ends_with('/')) {
    LocalRedirect(request, writer, std::string("../").append(PathBase(urlPath)));
    return;
  }

  if (file.isDirectory()) {
    if (!_config.defaultIndex.empty()) {
      const std::filesystem::path indexPath = fsPath / _config.defaultIndex;
      File index(indexPath.c_str());
      if (index && index.isRegular()) {
        serveContent(request, writer, _config.defaultIndex, index);
        return;
      }
    }
    serveDirectory(request, writer, fsPath, file);
    return;
  }

  if (!file.isRegular()) {
    ServeError(writer, http::StatusCodeNotFound);
    return;
  }
  serveContent(request, writer, name, file);
}

void StaticFileHandler::serveDirectory(const HttpRequest& request, ResponseWriter& writer,
                                       const std::filesystem::path& dirPath, const File& dir) const {
  if (!_config.enableDirectoryListing) {
    ServeError(writer, http::StatusCodeForbidden);
    return;
  }
  if (_config.enableConditional && CheckIfModifiedSince(request, dir.lastModified()) == Cond::False) {
    WriteNotModified(writer);
    return;
  }

  const auto listing = CollectDirectoryListing(dirPath, _config);
  if (!listing.error.empty()) {
    _logger.error("Error reading directory", {{"path", request.path()}, {"error", listing.error}});
    ServeError(writer, http::StatusCodeInternalServerError, "Error reading directory");
    return;
  }

  HttpHeaders& headers = writer.headers();
  if (_config.addLastModified && !IsZeroTime(dir.lastModified())) {
    headers.set(http::LastModified, FormatHttpDate(dir.lastModified()));
  }
  const std::string body = RenderDirectoryListing(request.path(), listing.entries, listing.truncated);
  headers.set(http::ContentType, http::ContentTypeTextHtml);
  headers.set(http::ContentLength, fmt::format("{}", body.size()));
  writer.writeHeader(http::StatusCodeOK);
  writer.write(body);
}

void StaticFileHandler::serveContent(const HttpRequest& request, ResponseWriter& writer, std::string_view name,
                                     const File& file) const {
  const uint64_t size = file.size();
  const SysTimePoint lastModified = file.lastModified();

  HttpHeaders& headers = writer.headers();
  if (_config.addLastModified && !IsZeroTime(lastModified)) {
    headers.set(http::LastModified, FormatHttpDate(lastModified));
  }
  if (_config.addEtag) {
    headers.set(http::ETag, MakeStrongEtag(size, lastModified));
  }

  bool rangeAllowed = _config.enableRange;
  if (_config.enableConditional) {
    bool ifRangeMatches = true;
    if (CheckPreconditions(request, writer, lastModified, ifRangeMatches)) {
      return;
    }
    rangeAllowed = rangeAllowed && ifRangeMatches;
  }

  std::string_view contentType = DetermineMIMETypeStr(name);
  if (contentType.empty()) {
    std::array<char, kSniffLen> sniffBuf;
    const auto nbRead = file.readAt(std::span<char>(sniffBuf.data(), std::min<uint64_t>(size, kSniffLen)), 0);
    if (nbRead < 0) {
      const auto err = errno;
      _logger.error("Error reading file", {{"path", name}, {"error", std::system_category().message(err)}});
      ServeError(writer, http::StatusCodeInternalServerError);
      return;
    }
    contentType = DetectContentType(std::string_view(sniffBuf.data(), static_cast<std::size_t>(nbRead)));
  }
  headers.set(http::ContentType, contentType);

  http::StatusCode code = http::StatusCodeOK;
  uint64_t offset = 0;
  uint64_t sendSize = size;
  if (_config.enableRange) {
    const auto rangeHeader = rangeAllowed ? request.headerValueOrEmpty(http::Range) : std::string_view{};
    if (!rangeHeader.empty()) {
      std::vector<ByteRange> ranges;
      switch (ParseRange(rangeHeader, size, ranges)) {
        case RangeError::Invalid:
          ServeError(writer, http::StatusCodeRangeNotSatisfiable, "invalid range");
          return;
        case RangeError::NoOverlap:
          headers.set(http::ContentRange, fmt::format("bytes */{}", size));
          ServeError(writer, http::StatusCodeRangeNotSatisfiable, "invalid range: failed to overlap");
          return;
        default:
          break;
      }
      // A client asking for more than the whole content is better served by the content itself.
      // Several ranges would require a multipart/byteranges body: the full content is sent instead.
      if (ranges.size() == 1U && !RangesExceedSize(ranges, size)) {
        const ByteRange& range = ranges.front();
        code = http::StatusCodePartialContent;
        offset = range.start;
        sendSize = range.length;
        headers.set(http::ContentRange,
                    fmt::format("bytes {}-{}/{}", range.start, range.start + range.length - 1U, size));
      }
    }
    headers.set(http::AcceptRanges, "bytes");
  }
  headers.set(http::ContentLength, fmt::format("{}", sendSize));
  writer.writeHeader(code);

  if (request.method() == http::HEAD) {
    return;
  }

  std::string chunk(static_cast<std::size_t>(std::min<uint64_t>(sendSize, _config.readChunkSize)), '\0');
  while (sendSize != 0) {
    const auto toRead = static_cast<std::size_t>(std::min<uint64_t>(sendSize, chunk.size()));
    const auto nbRead = file.readAt(std::span<char>(chunk.data(), toRead), offset);
    if (nbRead < 0) {
      const auto err = errno;
      _logger.error("Error reading file", {{"path", name}, {"error", std::system_category().message(err)}});
      return;
    }
    if (nbRead == 0) {
      // File truncated while being served.
      return;
    }
    const auto nbBytes = static_cast<std::size_t>(nbRead);
    if (writer.write(std::string_view(chunk.data(), nbBytes)) != nbBytes) {
      return;
    }
    offset += nbBytes;
    sendSize -= nbBytes;
  }
}

}  // namespace quay
