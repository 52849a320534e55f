#pragma once

namespace quay::url {

// Decodes percent-encoded sequences of [first, last) in place and returns the new end of the decoded range.
// '+' is left untouched: in a request path it is a literal character.
// Returns nullptr if an invalid or truncated escape ('%' not followed by two hex digits) is found.
char *DecodePathInPlace(char *first, const char *last);

}  // namespace quay::url
