#include "ember/precompressed-variant.hpp"

#include <string_view>

#include "ember/string-equal-ignore-case.hpp"
#include "ember/string-trim.hpp"

namespace ember {

bool AcceptEncodingAdvertises(std::string_view acceptEncoding, PrecompressedVariant variant) noexcept {
  const std::string_view expected = GetEncodingStr(variant);
  while (!acceptEncoding.empty()) {
    const auto commaPos = acceptEncoding.find(',');
    std::string_view element = acceptEncoding.substr(0, commaPos);
    element = TrimOws(element.substr(0, element.find(';')));
    if (CaseInsensitiveEqual(element, expected)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    acceptEncoding.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace ember
