#pragma once

#include <cstdint>

namespace ember::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;

inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;

inline constexpr StatusCode StatusCodeInternalServerError = 500;

}  // namespace ember::http
