#pragma once

#if !defined(__linux__)
#error "quay only supports Linux"
#endif

namespace quay {

using NativeHandle = int;

inline constexpr NativeHandle kInvalidHandle = -1;

}  // namespace quay
