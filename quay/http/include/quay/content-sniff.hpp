#pragma once

#include <cstddef>
#include <string_view>

namespace quay {

// Maximum number of leading bytes considered by DetectContentType.
inline constexpr std::size_t kSniffLen = 512;

// Guesses the Content-Type of given data from its first bytes.
// Recognizes HTML documents, a few common binary signatures (PNG, GIF, JPEG, PDF, ZIP, gzip, WebP, WASM) and
// falls back on "text/plain; charset=utf-8" for text without control bytes, "application/octet-stream" otherwise.
[[nodiscard]] std::string_view DetectContentType(std::string_view data) noexcept;

}  // namespace quay
