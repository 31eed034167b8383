#include <optional>
#include <string_view>

#include "ember/http-method.hpp"
#include "ember/string-equal-ignore-case.hpp"

namespace ember::http {

std::optional<Method> MethodStrToOpt(std::string_view str) {
  for (MethodIdx idx = 0; idx < kNbMethods; ++idx) {
    if (CaseInsensitiveEqual(str, kMethodStrings[idx])) {
      return static_cast<Method>(1U << idx);
    }
  }
  return std::nullopt;
}

}  // namespace ember::http
