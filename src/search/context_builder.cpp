#include "search/context_builder.hpp"

#include "core/errors.hpp"
#include "util/text.hpp"

namespace kbengine {
namespace {

std::string render_snippet(const SearchResult& result, const ContextOptions& options) {
    const bool with_source = options.include_source && result.source && !result.source->empty();

    std::string snippet;
    if (options.format == ContextFormat::Markdown) {
        if (with_source) {
            snippet.append("### ").append(*result.source).append("\n");
        }
        snippet.append(result.content).append("\n");
    } else {
        if (with_source) {
            snippet.append("[Fonte: ").append(*result.source).append("]\n");
        }
        snippet.append(result.content).append("\n\n");
    }
    return snippet;
}

}  // namespace

ContextFormat format_from_string(std::string_view value) {
    if (value == "plain") {
        return ContextFormat::Plain;
    }
    if (value == "markdown") {
        return ContextFormat::Markdown;
    }
    throw InvalidOptionError("unknown context format: " + std::string{value});
}

const char* to_string(ContextFormat format) {
    return format == ContextFormat::Plain ? "plain" : "markdown";
}

std::string build_context(const std::vector<SearchResult>& results, const ContextOptions& options) {
    if (options.max_length < kMinContextLength || options.max_length > kMaxContextLength) {
        throw InvalidOptionError("max context length must be between 100 and 16000, got " +
                                 std::to_string(options.max_length));
    }

    const auto limit = static_cast<std::size_t>(options.max_length);
    std::string context;
    std::size_t length = 0;
    for (const auto& result : results) {
        std::string snippet = render_snippet(result, options);
        const std::size_t snippet_length = text::utf8_length(snippet);
        if (length + snippet_length > limit) {
            break;
        }
        context.append(snippet);
        length += snippet_length;
    }
    return context;
}

}  // namespace kbengine
