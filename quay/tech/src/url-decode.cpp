#include "quay/url-decode.hpp"

#include "quay/char-hexadecimal-converter.hpp"

namespace quay::url {

char *DecodePathInPlace(char *first, const char *last) {
  char *out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (last - first < 3) {
      return nullptr;
    }
    const int v1 = from_hex_digit(first[1]);
    const int v2 = from_hex_digit(first[2]);
    if (v1 < 0 || v2 < 0) {
      return nullptr;
    }
    *out++ = static_cast<char>((v1 << 4) | v2);
    first += 2;
  }
  return out;
}

}  // namespace quay::url
