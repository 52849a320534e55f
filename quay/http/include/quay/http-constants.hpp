#pragma once

#include <string_view>

namespace quay::http {

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";

// Header names
inline constexpr std::string_view AcceptRanges = "Accept-Ranges";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view CacheControl = "Cache-Control";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view ETag = "ETag";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view IfMatch = "If-Match";
inline constexpr std::string_view IfModifiedSince = "If-Modified-Since";
inline constexpr std::string_view IfNoneMatch = "If-None-Match";
inline constexpr std::string_view IfRange = "If-Range";
inline constexpr std::string_view IfUnmodifiedSince = "If-Unmodified-Since";
inline constexpr std::string_view LastModified = "Last-Modified";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Range = "Range";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view UserAgent = "User-Agent";
inline constexpr std::string_view XContentTypeOptions = "X-Content-Type-Options";

// Header values
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeTextHtml = "text/html; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";

}  // namespace quay::http
