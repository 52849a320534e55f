#include "quay/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string_view>

#include "quay/toupperlower.hpp"

namespace quay {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

static_assert(std::size(kMIMEMappings) < std::numeric_limits<MIMETypeIdx>::max(),
              "kMIMEMappings size exceeds MIMETypeIdx capacity");

MIMETypeIdx DetermineMIMETypeIdx(std::string_view path) {
  static constexpr std::size_t kMaximumKnownExtensionSize =
      std::ranges::max_element(kMIMEMappings, {}, [](const MIMEMapping &mapping) {
        return mapping.extension.size();
      })->extension.size();

  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos) {
    return kUnknownMIMEMappingIdx;
  }
  const auto extSize = path.size() - dotPos - 1U;
  if (extSize == 0 || extSize > kMaximumKnownExtensionSize || path.find('/', dotPos) != std::string_view::npos) {
    return kUnknownMIMEMappingIdx;
  }

  char extBuf[kMaximumKnownExtensionSize];
  const auto endIt = std::transform(path.begin() + static_cast<std::ptrdiff_t>(dotPos) + 1, path.end(), extBuf,
                                    [](char ch) { return tolower(ch); });

  const std::string_view ext(extBuf, endIt);
  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return static_cast<MIMETypeIdx>(std::distance(std::begin(kMIMEMappings), it));
  }
  return kUnknownMIMEMappingIdx;
}

std::string_view DetermineMIMETypeStr(std::string_view path) {
  const MIMETypeIdx idx = DetermineMIMETypeIdx(path);
  if (idx != kUnknownMIMEMappingIdx) {
    return kMIMEMappings[idx].contentType;
  }
  return {};
}

}  // namespace quay
