#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

#include "ember/http-constants.hpp"

namespace ember {

// Pre-compressed copies of an asset stored next to it under a derived key (key + suffix).
// Ordered from most preferred to least preferred.
enum class PrecompressedVariant : std::uint8_t {
  br,
  gzip,
};

inline constexpr std::underlying_type_t<PrecompressedVariant> kNbPrecompressedVariants =
    static_cast<std::underlying_type_t<PrecompressedVariant>>(PrecompressedVariant::gzip) + 1;

inline constexpr PrecompressedVariant kPrecompressedVariantsByPreference[] = {PrecompressedVariant::br,
                                                                              PrecompressedVariant::gzip};

// Content-Encoding token of the variant.
constexpr std::string_view GetEncodingStr(PrecompressedVariant variant) {
  constexpr std::string_view kEncodingStrs[kNbPrecompressedVariants] = {http::br, http::gzip};
  return kEncodingStrs[static_cast<std::underlying_type_t<PrecompressedVariant>>(variant)];
}

// Suffix appended to the asset key to obtain the key of the variant.
constexpr std::string_view GetKeySuffix(PrecompressedVariant variant) {
  constexpr std::string_view kKeySuffixes[kNbPrecompressedVariants] = {".br", ".gz"};
  return kKeySuffixes[static_cast<std::underlying_type_t<PrecompressedVariant>>(variant)];
}

// Tells whether an Accept-Encoding header value lists the content coding of 'variant'.
// Only the presence of the token is checked (case-insensitively): parameters, including q-values,
// are ignored, and a '*' wildcard does not count as listing any coding.
[[nodiscard]] bool AcceptEncodingAdvertises(std::string_view acceptEncoding, PrecompressedVariant variant) noexcept;

}  // namespace ember
