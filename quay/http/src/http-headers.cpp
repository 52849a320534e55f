#include "quay/http-headers.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <vector>

#include "quay/string-equal-ignore-case.hpp"

namespace quay {

std::optional<std::string_view> HttpHeaders::get(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.first, name); });
  if (it == _fields.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

std::size_t HttpHeaders::count(std::string_view name) const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.first, name); }));
}

HttpHeaders& HttpHeaders::set(std::string_view name, std::string_view value) {
  auto it =
      std::ranges::find_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.first, name); });
  if (it == _fields.end()) {
    _fields.emplace_back(name, value);
    return *this;
  }
  it->second.assign(value);
  // drop duplicates located after the first occurrence
  const auto [first, last] = std::ranges::remove_if(
      std::next(it), _fields.end(), [name](const Field& field) { return CaseInsensitiveEqual(field.first, name); });
  _fields.erase(first, last);
  return *this;
}

HttpHeaders& HttpHeaders::add(std::string_view name, std::string_view value) {
  _fields.emplace_back(name, value);
  return *this;
}

std::size_t HttpHeaders::erase(std::string_view name) {
  return static_cast<std::size_t>(
      std::erase_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.first, name); }));
}

}  // namespace quay
