#pragma once

#include <string>
#include <string_view>

namespace quay {

// Returns the shortest slash-separated path equivalent to '/' + path, by purely lexical processing:
//  - sequences of slashes are replaced by a single one
//  - '.' segments are removed
//  - '..' segments remove the preceding segment, and are dropped when reaching the root
//  - the result never ends with a slash, except for the root "/" itself
// Examples:
//  ""            -> "/"
//  "a//b/./c/"   -> "/a/b/c"
//  "/../../etc"  -> "/etc"
[[nodiscard]] std::string CleanRootedPath(std::string_view path);

}  // namespace quay
