#include "quay/connection-response-writer.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "quay/content-sniff.hpp"
#include "quay/http-constants.hpp"
#include "quay/http-status-code.hpp"
#include "quay/socket-ops.hpp"
#include "quay/string-equal-ignore-case.hpp"
#include "quay/timedef.hpp"
#include "quay/timestring.hpp"

namespace quay {

namespace {

bool SendAllOnSocket(NativeHandle fd, std::string_view data) noexcept {
  while (!data.empty()) {
    const auto sent = SafeSend(fd, data);
    if (sent == -1) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

void AppendStatusLine(std::string& out, bool http11, http::StatusCode code) {
  const std::string_view reason = http::ReasonPhrase(code);
  if (reason.empty()) {
    fmt::format_to(std::back_inserter(out), "{} {} status code {}\r\n", http11 ? http::HTTP11Sv : http::HTTP10Sv,
                   code, code);
  } else {
    fmt::format_to(std::back_inserter(out), "{} {} {}\r\n", http11 ? http::HTTP11Sv : http::HTTP10Sv, code, reason);
  }
}

void AppendDate(HttpHeaders& headers) {
  char buf[kRFC7231DateStrLen];
  TimeToStringRFC7231(SysClock::now(), buf);
  headers.set(http::Date, std::string_view(buf, sizeof(buf)));
}

}  // namespace

ConnectionResponseWriter::ConnectionResponseWriter(NativeHandle fd, const HttpRequest& request, bool keepAlive,
                                                   const StructuredLogger& logger) noexcept
    : _fd(fd), _request(request), _logger(logger), _isHead(request.method() == http::HEAD), _keepAlive(keepAlive) {}

void ConnectionResponseWriter::writeHeader(http::StatusCode code) {
  if (code < 100 || code > 999) {
    throw std::invalid_argument(fmt::format("invalid response status code {}", code));
  }
  if (_status != 0) {
    _logger.warn("superfluous writeHeader call", {{"path", _request.path()}, {"status", code}});
    return;
  }
  _status = code;

  if (const auto contentLength = _headers.get(http::ContentLength)) {
    uint64_t value = 0;
    const auto* first = contentLength->data();
    const auto* last = first + contentLength->size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc{} && ptr == last) {
      _declaredLength = value;
    } else {
      _logger.warn("invalid Content-Length set by handler", {{"value", *contentLength}});
      _headers.erase(http::ContentLength);
    }
  }
}

std::size_t ConnectionResponseWriter::write(std::string_view data) {
  if (_status == 0) {
    writeHeader(http::StatusCodeOK);
  }
  if (!_ok || !http::BodyAllowedForStatus(_status)) {
    return 0;
  }
  if (_declaredLength && _bodyBytes + data.size() > *_declaredLength) {
    return 0;
  }
  _bodyBytes += data.size();

  if (_isHead) {
    // Only kept for Content-Type sniffing.
    if (!_headSent && _buffer.size() < kSniffLen) {
      _buffer.append(data.substr(0, kSniffLen - _buffer.size()));
    }
    return data.size();
  }

  _buffer.append(data);
  if (_buffer.size() >= kBufferSize) {
    if (!_headSent) {
      sendHead(false);
    }
    flushBuffer();
  }
  return _ok ? data.size() : 0;
}

bool ConnectionResponseWriter::finish() {
  if (_status == 0) {
    writeHeader(http::StatusCodeOK);
  }
  if (!_headSent) {
    sendHead(true);
  }
  flushBuffer();
  if (_framing == Framing::Chunked) {
    sendAll("0\r\n\r\n");
  }
  if (_framing == Framing::ContentLength && _declaredLength && _bodyBytes < *_declaredLength) {
    // The client still waits for the missing bytes: the connection cannot be reused.
    _keepAlive = false;
  }
  return _ok && _keepAlive;
}

void ConnectionResponseWriter::sendHead(bool final) {
  _headSent = true;

  const bool bodyAllowed = http::BodyAllowedForStatus(_status);
  if (bodyAllowed && !_buffer.empty() && !_headers.contains(http::ContentType)) {
    _headers.set(http::ContentType, DetectContentType(_buffer));
  }
  _headers.erase(http::TransferEncoding);

  if (!bodyAllowed) {
    _framing = Framing::NoBody;
  } else if (_isHead) {
    _framing = Framing::NoBody;
    if (final && !_declaredLength && _bodyBytes != 0) {
      _headers.set(http::ContentLength, std::string_view(fmt::format("{}", _bodyBytes)));
    }
  } else if (_declaredLength) {
    _framing = Framing::ContentLength;
  } else if (final) {
    _framing = Framing::ContentLength;
    _headers.set(http::ContentLength, std::string_view(fmt::format("{}", _buffer.size())));
  } else if (_request.isHttp11OrLater()) {
    _framing = Framing::Chunked;
    _headers.set(http::TransferEncoding, http::chunked);
  } else {
    _framing = Framing::CloseDelimited;
    _keepAlive = false;
  }

  if (CaseInsensitiveListContains(_headers.getOrEmpty(http::Connection), http::close)) {
    _keepAlive = false;
  }
  _headers.erase(http::Connection);
  if (!_keepAlive && _request.isHttp11OrLater()) {
    _headers.set(http::Connection, http::close);
  } else if (_keepAlive && !_request.isHttp11OrLater()) {
    _headers.set(http::Connection, http::keepalive);
  }
  if (!_headers.contains(http::Date)) {
    AppendDate(_headers);
  }

  std::string head;
  head.reserve(256);
  AppendStatusLine(head, _request.isHttp11OrLater(), _status);
  for (const auto& [name, value] : _headers) {
    head.append(name);
    head.append(http::HeaderSep);
    head.append(value);
    head.append(http::CRLF);
  }
  head.append(http::CRLF);
  sendAll(head);
}

void ConnectionResponseWriter::flushBuffer() {
  if (_buffer.empty()) {
    return;
  }
  switch (_framing) {
    case Framing::Chunked:
      if (sendAll(fmt::format("{:x}\r\n", _buffer.size())) && sendAll(_buffer)) {
        sendAll(http::CRLF);
      }
      break;
    case Framing::ContentLength:
    case Framing::CloseDelimited:
      sendAll(_buffer);
      break;
    default:
      break;
  }
  _buffer.clear();
}

bool ConnectionResponseWriter::sendAll(std::string_view data) {
  if (_ok && !SendAllOnSocket(_fd, data)) {
    _ok = false;
    _keepAlive = false;
  }
  return _ok;
}

bool SendTransportError(NativeHandle fd, http::StatusCode code) {
  std::string response;
  const std::string body = fmt::format("{} {}", code, http::ReasonPhrase(code));
  AppendStatusLine(response, true, code);
  fmt::format_to(std::back_inserter(response),
                 "Content-Type: {}\r\nContent-Length: {}\r\nConnection: close\r\n\r\n{}", http::ContentTypeTextPlain,
                 body.size(), body);
  return SendAllOnSocket(fd, response);
}

}  // namespace quay
