#pragma once

namespace quay {

// ASCII only, locale independent.
constexpr char tolower(char ch) { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

}  // namespace quay
