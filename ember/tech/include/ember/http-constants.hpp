#pragma once

#include <string_view>

namespace ember::http {

// Header field names are case-insensitive per RFC 9110. They are stored here in their
// conventional canonical form for emission; lookups go through CaseInsensitiveEqual.

// Headers
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view CacheControl = "Cache-Control";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view Range = "Range";

// Content codings
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view br = "br";  // RFC 7932 (Brotli)

// Reason phrases
inline constexpr std::string_view ReasonOK = "OK";                                      // 200
inline constexpr std::string_view NotFound = "Not Found";                               // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";        // 405
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";  // 500

// Content types
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";

}  // namespace ember::http
