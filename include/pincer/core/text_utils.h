#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pincer {

// '*' matches any run, '?' any single character.
bool matchGlob(const std::string& text, const std::string& pattern);

// "https://user@Example.com:8443/x?y" -> "example.com"; empty when no authority is present.
std::string hostFromUrl(std::string_view url);

// Prefix of at most maxBytes bytes, never splitting a UTF-8 sequence.
std::string truncateUtf8(std::string_view text, std::size_t maxBytes);

// RFC 3986 query component encoding; unreserved characters pass through.
std::string percentEncode(std::string_view text);
// Inverse of percentEncode; '+' decodes to a space, malformed escapes are kept verbatim.
std::string percentDecode(std::string_view text);

} // namespace pincer
