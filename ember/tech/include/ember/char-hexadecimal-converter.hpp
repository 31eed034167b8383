#pragma once

namespace ember {

/// Returns the value of the hexadecimal digit 'ch' (case insensitive), or -1 if 'ch' is not one.
/// Examples:
///  '7' -> 7
///  'b' -> 11
///  'F' -> 15
///  'g' -> -1
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  return -1;
}

}  // namespace ember
