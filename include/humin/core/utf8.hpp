#pragma once

#include <string>
#include <string_view>

namespace humin {

// Malformed sequences decode to U+FFFD, one per offending byte.
std::u32string decode_utf8(std::string_view text);
std::string encode_utf8(char32_t c);
std::string encode_utf8(std::u32string_view text);

}  // namespace humin
