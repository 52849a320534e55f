#include "quay/path-clean.hpp"

#include <string>
#include <string_view>

namespace quay {

std::string CleanRootedPath(std::string_view path) {
  std::string out;
  out.reserve(path.size() + 1U);
  out.push_back('/');

  while (!path.empty()) {
    const auto slashPos = path.find('/');
    const auto segment = path.substr(0, slashPos);
    if (segment == "..") {
      if (out.size() > 1U) {
        out.resize(out.find_last_of('/', out.size() - 2U) + 1U);
      }
    } else if (!segment.empty() && segment != ".") {
      out.append(segment);
      out.push_back('/');
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slashPos + 1);
  }

  if (out.size() > 1U) {
    out.pop_back();
  }
  return out;
}

}  // namespace quay
