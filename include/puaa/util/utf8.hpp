#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace puaa::util {

// Byte offset of the first invalid sequence, or nullopt if data is valid UTF-8.
// Overlong forms, surrogates and values above U+10FFFF are invalid.
std::optional<size_t> find_invalid_utf8(std::string_view data);

// Decode UTF-8 bytes to Unicode codepoints (invalid sequences become U+FFFD)
std::vector<uint32_t> decode_utf8(std::string_view data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

// Length of a leading UTF-8 byte order mark (0 or 3)
size_t bom_length(std::string_view data);

} // namespace puaa::util
