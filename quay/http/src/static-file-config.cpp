#include "quay/static-file-config.hpp"

#include <stdexcept>

namespace quay {

void StaticFileConfig::validate() const {
  if (defaultIndex.contains('/') || defaultIndex.contains('\0')) {
    throw std::invalid_argument("StaticFileConfig.defaultIndex must be a plain file name");
  }
  if (readChunkSize == 0) {
    throw std::invalid_argument("StaticFileConfig.readChunkSize must be positive");
  }
}

}  // namespace quay
