#pragma once

#include <cstdint>
#include <string_view>

namespace quay::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodePartialContent = 206;

inline constexpr StatusCode StatusCodeMovedPermanently = 301;
inline constexpr StatusCode StatusCodeFound = 302;
inline constexpr StatusCode StatusCodeNotModified = 304;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodeRequestTimeout = 408;
inline constexpr StatusCode StatusCodePreconditionFailed = 412;
inline constexpr StatusCode StatusCodeRangeNotSatisfiable = 416;
inline constexpr StatusCode StatusCodeRequestHeaderFieldsTooLarge = 431;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;
inline constexpr StatusCode StatusCodeHTTPVersionNotSupported = 505;

// Standard reason phrase of given status code, or an empty string_view for unknown codes.
[[nodiscard]] std::string_view ReasonPhrase(StatusCode code) noexcept;

// Whether a response with given status may carry a body (RFC 9110: not 1xx, 204 or 304).
constexpr bool BodyAllowedForStatus(StatusCode code) noexcept {
  return !((code >= 100 && code < 200) || code == StatusCodeNoContent || code == StatusCodeNotModified);
}

}  // namespace quay::http
