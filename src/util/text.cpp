#include "util/text.hpp"

#include <algorithm>

namespace kbengine::text {
namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

bool is_space(char c) { return kWhitespace.find(c) != std::string_view::npos; }

bool is_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

}  // namespace

std::string trim(std::string_view value) {
    const auto first = value.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(kWhitespace);
    return std::string{value.substr(first, last - first + 1)};
}

std::string to_lower_ascii(std::string_view value) {
    std::string out{value};
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return out;
}

std::size_t utf8_length(std::string_view value) {
    std::size_t count = 0;
    for (const char c : value) {
        if (!is_continuation(c)) {
            ++count;
        }
    }
    return count;
}

std::size_t utf8_floor(std::string_view value, std::size_t offset) {
    if (offset >= value.size()) {
        return value.size();
    }
    while (offset > 0 && is_continuation(value[offset])) {
        --offset;
    }
    return offset;
}

std::size_t utf8_ceil(std::string_view value, std::size_t offset) {
    while (offset < value.size() && is_continuation(value[offset])) {
        ++offset;
    }
    return std::min(offset, value.size());
}

std::vector<std::string> split_whitespace(std::string_view value) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < value.size()) {
        while (i < value.size() && is_space(value[i])) {
            ++i;
        }
        const std::size_t start = i;
        while (i < value.size() && !is_space(value[i])) {
            ++i;
        }
        if (i > start) {
            tokens.emplace_back(value.substr(start, i - start));
        }
    }
    return tokens;
}

std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

}  // namespace kbengine::text
