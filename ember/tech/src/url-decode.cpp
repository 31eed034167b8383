#include "ember/url-decode.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "ember/char-hexadecimal-converter.hpp"

namespace ember::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        // fewer than two hexits left before 'last'
        if (last - first <= 2) {
          if (strictInvalid) {
            return nullptr;
          }
          // copy the truncated escape literally
          while (first < last) {
            *out++ = *first++;
          }
          return out;
        }
        char c1 = *++first;
        char c2 = *++first;
        int v1 = from_hex_digit(c1);
        int v2 = from_hex_digit(c2);
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          *out++ = c1;
          *out++ = c2;
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::optional<std::string> DecodePath(std::string_view path) {
  std::string decoded(path);
  char* first = decoded.data();
  const char* newEnd = DecodeInPlace(first, first + decoded.size(), '+', /*strictInvalid*/ true);
  if (newEnd == nullptr) {
    return std::nullopt;
  }
  decoded.resize(static_cast<std::size_t>(newEnd - first));
  if (decoded.find('\0') != std::string::npos) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace ember::url
