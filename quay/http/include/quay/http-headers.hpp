#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quay {

// Ordered list of HTTP header fields with case-insensitive name lookups.
// Insertion order is preserved, which is also the serialization order.
class HttpHeaders {
 public:
  using Field = std::pair<std::string, std::string>;

  // Value of the first field named 'name', or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view getOrEmpty(std::string_view name) const noexcept {
    return get(name).value_or(std::string_view{});
  }

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  // Number of fields named 'name'.
  [[nodiscard]] std::size_t count(std::string_view name) const noexcept;

  // Replaces all fields named 'name' by a single one (appended if absent).
  HttpHeaders& set(std::string_view name, std::string_view value);

  // Appends a field, even if another field with the same name exists.
  HttpHeaders& add(std::string_view name, std::string_view value);

  // Removes all fields named 'name'. Returns the number of removed fields.
  std::size_t erase(std::string_view name);

  void clear() noexcept { _fields.clear(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] auto begin() const noexcept { return _fields.begin(); }
  [[nodiscard]] auto end() const noexcept { return _fields.end(); }

  bool operator==(const HttpHeaders&) const noexcept = default;

 private:
  std::vector<Field> _fields;
};

}  // namespace quay
