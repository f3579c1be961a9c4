#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"

namespace kbengine {

enum class ContextFormat { Plain, Markdown };

// Throws InvalidOptionError for anything other than "plain" or "markdown".
ContextFormat format_from_string(std::string_view value);
const char* to_string(ContextFormat format);

inline constexpr int kMinContextLength = 100;
inline constexpr int kMaxContextLength = 16000;

struct ContextOptions {
    int max_length = 4000;
    bool include_source = true;
    ContextFormat format = ContextFormat::Markdown;
};

// Packs results, in the given order, into one prompt-ready string whose length in
// code points never exceeds max_length. A snippet that does not fit ends the
// context; snippets are never cut. Throws InvalidOptionError when max_length is
// outside 100..16000.
std::string build_context(const std::vector<SearchResult>& results, const ContextOptions& options);

}  // namespace kbengine
