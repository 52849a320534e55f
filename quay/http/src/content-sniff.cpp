#include "quay/content-sniff.hpp"

#include <cstddef>
#include <string_view>

#include "quay/http-constants.hpp"
#include "quay/string-equal-ignore-case.hpp"

namespace quay {

namespace {

struct Signature {
  std::string_view prefix;
  std::string_view contentType;
};

constexpr Signature kBinarySignatures[] = {
    {"\x89PNG\r\n\x1A\n", "image/png"},
    {"GIF87a", "image/gif"},
    {"GIF89a", "image/gif"},
    {"\xFF\xD8\xFF", "image/jpeg"},
    {"%PDF-", "application/pdf"},
    {std::string_view("PK\x03\x04", 4), "application/zip"},
    {"\x1F\x8B\x08", "application/x-gzip"},
    {std::string_view("\x00\x61\x73\x6D", 4), "application/wasm"},
};

// HTML tags recognized at the start of the document (after whitespace), when followed by a space or '>'.
constexpr std::string_view kHtmlTags[] = {
    "<!DOCTYPE HTML", "<HTML", "<HEAD", "<SCRIPT", "<IFRAME", "<H1", "<DIV", "<FONT", "<TABLE", "<A",
    "<STYLE",         "<TITLE", "<B",   "<BODY",   "<BR",     "<P",  "<!--",
};

constexpr bool IsWhitespace(char ch) { return ch == '\t' || ch == '\n' || ch == '\x0C' || ch == '\r' || ch == ' '; }

// Binary data bytes per WHATWG MIME sniffing: control chars other than whitespace and ESC.
constexpr bool IsBinaryDataByte(unsigned char uc) {
  return uc <= 0x08U || uc == 0x0BU || (uc >= 0x0EU && uc <= 0x1AU) || (uc >= 0x1CU && uc <= 0x1FU);
}

bool IsHtml(std::string_view data) {
  while (!data.empty() && IsWhitespace(data.front())) {
    data.remove_prefix(1);
  }
  for (std::string_view tag : kHtmlTags) {
    if (!StartsWithCaseInsensitive(data, tag)) {
      continue;
    }
    if (tag == "<!--") {
      return true;
    }
    if (data.size() > tag.size() && (data[tag.size()] == ' ' || data[tag.size()] == '>')) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string_view DetectContentType(std::string_view data) noexcept {
  if (data.size() > kSniffLen) {
    data = data.substr(0, kSniffLen);
  }

  for (const Signature& signature : kBinarySignatures) {
    if (data.starts_with(signature.prefix)) {
      return signature.contentType;
    }
  }
  if (data.size() >= 12 && data.starts_with("RIFF") && data.substr(8, 4) == "WEBP") {
    return "image/webp";
  }
  if (IsHtml(data)) {
    return http::ContentTypeTextHtml;
  }
  for (char ch : data) {
    if (IsBinaryDataByte(static_cast<unsigned char>(ch))) {
      return http::ContentTypeApplicationOctetStream;
    }
  }
  return http::ContentTypeTextPlain;
}

}  // namespace quay
