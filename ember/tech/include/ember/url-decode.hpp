#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ember::url {

// Decodes within the provided char range, compacting percent-encoded sequences and translating
// '+' to 'plusAs' (leave it as '+' for paths, use ' ' only for form-encoded query values).
// When 'strictInvalid' is true, returns nullptr on invalid encoding (truncated % or non-hex digits)
// leaving the range in an unspecified partially modified state (caller should discard it).
// Otherwise invalid escapes are copied through literally.
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

// Strictly decodes a request path into a new string.
// Returns std::nullopt on any invalid escape or if the decoded path contains a NUL byte.
std::optional<std::string> DecodePath(std::string_view path);

}  // namespace ember::url
