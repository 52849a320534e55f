#include "quay/http-request.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "quay/http-constants.hpp"
#include "quay/http-status-code.hpp"
#include "quay/string-equal-ignore-case.hpp"
#include "quay/string-trim.hpp"
#include "quay/tchars.hpp"
#include "quay/url-decode.hpp"

namespace quay {

namespace {

// Extracts the next line of 'buf' (without its CRLF or LF terminator).
std::string_view NextLine(std::string_view& buf) {
  const auto lfPos = buf.find('\n');
  std::string_view line = buf.substr(0, lfPos);
  buf.remove_prefix(lfPos == std::string_view::npos ? buf.size() : lfPos + 1);
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

// Control chars (except HTAB) are not allowed in field values.
constexpr bool IsValidFieldValue(std::string_view value) {
  for (char ch : value) {
    const auto uc = static_cast<unsigned char>(ch);
    if ((uc < 0x20U && ch != '\t') || uc == 0x7FU) {
      return false;
    }
  }
  return true;
}

// No whitespace nor control chars in a request target.
constexpr bool IsValidTarget(std::string_view target) {
  for (char ch : target) {
    const auto uc = static_cast<unsigned char>(ch);
    if (uc <= 0x20U || uc == 0x7FU) {
      return false;
    }
  }
  return !target.empty();
}

// Parses "HTTP/x.y". Returns false if malformed.
bool ParseVersion(std::string_view proto, uint8_t& major, uint8_t& minor) {
  static constexpr std::string_view kPrefix = "HTTP/";
  if (proto.size() != kPrefix.size() + 3 || !proto.starts_with(kPrefix) || !IsDigit(proto[5]) || proto[6] != '.' ||
      !IsDigit(proto[7])) {
    return false;
  }
  major = static_cast<uint8_t>(proto[5] - '0');
  minor = static_cast<uint8_t>(proto[7] - '0');
  return true;
}

// Parses a Content-Length value. Returns std::nullopt if it is not a valid non-negative integer.
std::optional<uint64_t> ParseContentLength(std::string_view value) {
  if (value.empty() || value.size() > 19U) {
    return std::nullopt;
  }
  uint64_t result = 0;
  for (char ch : value) {
    if (!IsDigit(ch)) {
      return std::nullopt;
    }
    result = (result * 10U) + static_cast<uint64_t>(ch - '0');
  }
  return result;
}

// Returns the origin-form part of an absolute-form target ("http://host/p" -> "/p"), or std::nullopt if the target is
// not in absolute form.
std::optional<std::string_view> StripAbsoluteForm(std::string_view target) {
  for (std::string_view scheme : {std::string_view("http://"), std::string_view("https://")}) {
    if (StartsWithCaseInsensitive(target, scheme)) {
      target.remove_prefix(scheme.size());
      const auto slashPos = target.find('/');
      if (slashPos == 0) {
        return std::nullopt;  // empty authority
      }
      return slashPos == std::string_view::npos ? std::string_view("/") : target.substr(slashPos);
    }
  }
  return std::nullopt;
}

}  // namespace

std::string_view HttpRequest::userAgent() const noexcept { return _headers.getOrEmpty(http::UserAgent); }

bool HttpRequest::wantsKeepAlive() const noexcept {
  bool hasClose = false;
  bool hasKeepAlive = false;
  for (const auto& [name, value] : _headers) {
    if (CaseInsensitiveEqual(name, http::Connection)) {
      hasClose = hasClose || CaseInsensitiveListContains(value, http::close);
      hasKeepAlive = hasKeepAlive || CaseInsensitiveListContains(value, http::keepalive);
    }
  }
  if (hasClose) {
    return false;
  }
  return isHttp11OrLater() || hasKeepAlive;
}

http::StatusCode ParseRequestHead(std::string_view head, std::string_view remoteAddr, HttpRequest& request) {
  request = HttpRequest{};
  request._remoteAddr.assign(remoteAddr);

  std::string_view requestLine;
  do {
    if (head.empty()) {
      return http::StatusCodeBadRequest;
    }
    requestLine = NextLine(head);
  } while (requestLine.empty());

  // method SP request-target SP HTTP-version
  const auto firstSp = requestLine.find(' ');
  if (firstSp == std::string_view::npos) {
    return http::StatusCodeBadRequest;
  }
  const auto secondSp = requestLine.find(' ', firstSp + 1);
  if (secondSp == std::string_view::npos) {
    return http::StatusCodeBadRequest;
  }
  const std::string_view method = requestLine.substr(0, firstSp);
  const std::string_view target = requestLine.substr(firstSp + 1, secondSp - firstSp - 1);
  const std::string_view proto = requestLine.substr(secondSp + 1);

  if (!IsToken(method) || !IsValidTarget(target)) {
    return http::StatusCodeBadRequest;
  }
  if (!ParseVersion(proto, request._versionMajor, request._versionMinor)) {
    return http::StatusCodeBadRequest;
  }
  if (request._versionMajor != 1) {
    return http::StatusCodeHTTPVersionNotSupported;
  }
  request._method.assign(method);
  request._target.assign(target);

  // Header fields
  while (!head.empty()) {
    const std::string_view line = NextLine(head);
    if (line.empty()) {
      break;
    }
    if (line.front() == ' ' || line.front() == '\t') {
      return http::StatusCodeBadRequest;  // obsolete line folding
    }
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      return http::StatusCodeBadRequest;
    }
    const std::string_view name = line.substr(0, colonPos);
    const std::string_view value = TrimOws(line.substr(colonPos + 1));
    if (!IsToken(name) || !IsValidFieldValue(value)) {
      return http::StatusCodeBadRequest;
    }
    request._headers.add(name, value);
  }

  const auto nbHosts = request._headers.count(http::Host);
  if (nbHosts > 1 || (nbHosts == 0 && request.isHttp11OrLater())) {
    return http::StatusCodeBadRequest;
  }

  std::optional<uint64_t> contentLength;
  for (const auto& [name, value] : request._headers) {
    if (!CaseInsensitiveEqual(name, http::ContentLength)) {
      continue;
    }
    const auto parsed = ParseContentLength(value);
    if (!parsed || (contentLength && *contentLength != *parsed)) {
      return http::StatusCodeBadRequest;
    }
    contentLength = parsed;
  }
  request._hasBody = contentLength.value_or(0) > 0 || request._headers.contains(http::TransferEncoding);

  // Request target: origin-form, absolute-form, asterisk-form ("*") or authority-form (CONNECT only)
  std::string_view pathPart = target.substr(0, target.find('?'));
  if (const auto queryPos = target.find('?'); queryPos != std::string_view::npos) {
    request._rawQuery.assign(target.substr(queryPos + 1));
  }
  if (target == "*") {
    request._path.assign("*");
    return 0;
  }
  if (pathPart.empty() || pathPart.front() != '/') {
    if (const auto originForm = StripAbsoluteForm(pathPart)) {
      pathPart = *originForm;
    } else if (method == "CONNECT") {
      return 0;  // authority-form, no path
    } else {
      return http::StatusCodeBadRequest;
    }
  }

  request._path.assign(pathPart);
  char* decodedEnd = url::DecodePathInPlace(request._path.data(), request._path.data() + request._path.size());
  if (decodedEnd == nullptr) {
    return http::StatusCodeBadRequest;
  }
  request._path.resize(static_cast<std::string::size_type>(decodedEnd - request._path.data()));
  if (request._path.find('\0') != std::string::npos) {
    return http::StatusCodeBadRequest;
  }
  return 0;
}

std::size_t FindRequestHeadEnd(std::string_view data) noexcept {
  std::size_t pos = 0;
  while (pos < data.size() && (data[pos] == '\r' || data[pos] == '\n')) {
    ++pos;
  }
  for (pos = data.find('\n', pos); pos != std::string_view::npos; pos = data.find('\n', pos + 1)) {
    if (pos + 1 < data.size() && data[pos + 1] == '\n') {
      return pos + 2;
    }
    if (pos + 2 < data.size() && data[pos + 1] == '\r' && data[pos + 2] == '\n') {
      return pos + 3;
    }
  }
  return std::string_view::npos;
}

}  // namespace quay
