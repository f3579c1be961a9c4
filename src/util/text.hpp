#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kbengine::text {

// Whitespace here is the ASCII set " \t\n\r\f\v".
std::string trim(std::string_view value);
std::string to_lower_ascii(std::string_view value);

// Number of Unicode code points in a UTF-8 string. Continuation bytes are not counted.
std::size_t utf8_length(std::string_view value);

// Nearest code point boundary at or before (floor) / at or after (ceil) offset,
// clamped to value.size().
std::size_t utf8_floor(std::string_view value, std::size_t offset);
std::size_t utf8_ceil(std::string_view value, std::size_t offset);

std::vector<std::string> split_whitespace(std::string_view value);

std::string strip_trailing_slashes(std::string url);

}  // namespace kbengine::text
