#pragma once

#include <string>
#include <string_view>

#include "quay/char-hexadecimal-converter.hpp"

namespace quay {

template <class IsNotEncodedFunc>
constexpr auto URLEncodedSize(std::string_view data, IsNotEncodedFunc isNotEncodedFunc) {
  std::string_view::size_type nbChars = 0;

  for (char ch : data) {
    if (isNotEncodedFunc(ch)) {
      ++nbChars;
    } else {
      nbChars += 3UL;
    }
  }

  return nbChars;
}

/// Appends to 'out' the URL encoded form of 'data'.
/// All input characters 'ch' for which isNotEncodedFunc(ch) is false are converted to %NN with NN the upper case
/// hexadecimal code of 'ch'.
template <class IsNotEncodedFunc>
void AppendURLEncoded(std::string_view data, IsNotEncodedFunc isNotEncodedFunc, std::string &out) {
  const auto oldSize = out.size();
  out.resize(oldSize + URLEncodedSize(data, isNotEncodedFunc));
  char *buf = out.data() + oldSize;
  for (char ch : data) {
    if (isNotEncodedFunc(ch)) {
      *buf++ = ch;
    } else {
      *buf = '%';
      buf = to_upper_hex(ch, ++buf);
    }
  }
}

// Characters that can appear unescaped in a path segment (RFC 3986 unreserved + sub-delims + ':' '@' '/').
constexpr bool IsPathChar(char ch) {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '-':
    case '.':
    case '_':
    case '~':
    case '/':
    case '!':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case ';':
    case '=':
    case ':':
    case '@':
      return true;
    default:
      return false;
  }
}

}  // namespace quay
