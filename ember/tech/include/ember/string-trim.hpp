#pragma once

#include <string_view>

namespace ember {

// Strips OWS (SP and HTAB, RFC 9110 §5.6.3) around a header value or around one element of a
// comma separated list, such as a coding of Accept-Encoding.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  const auto isOws = [](char ch) { return ch == ' ' || ch == '\t'; };
  while (!sv.empty() && isOws(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && isOws(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

}  // namespace ember
