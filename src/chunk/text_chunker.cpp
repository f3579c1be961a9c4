#include "chunk/text_chunker.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>

#include <openssl/sha.h>

#include "core/errors.hpp"
#include "util/text.hpp"

namespace kbengine {
namespace {

std::string normalize_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

// Offset just past the last occurrence of the most preferred separator present, or
// the window length when none occurs.
std::size_t find_break_point(const std::string& window, const std::vector<std::string>& separators) {
    for (const auto& separator : separators) {
        const auto index = window.rfind(separator);
        if (index != std::string::npos && index > 0) {
            return index + separator.size();
        }
    }
    return window.size();
}

TextChunk make_chunk(int position, std::string content, std::size_t start, std::size_t end) {
    TextChunk chunk;
    chunk.position = position;
    chunk.content_sha256 = sha256_hex(content);
    chunk.content = std::move(content);
    chunk.start_index = start;
    chunk.end_index = end;
    return chunk;
}

struct MarkdownSection {
    std::vector<std::string> headers;
    std::string content;
    std::size_t start_index = 0;
};

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined.append(lines[i]);
    }
    return joined;
}

std::vector<MarkdownSection> split_by_headers(const std::string& markdown) {
    static const std::regex kHeader{R"(^(#{1,6})\s+(.+)$)"};

    std::vector<MarkdownSection> sections;
    std::vector<std::string> headers;
    std::vector<std::string> lines;
    std::size_t section_start = 0;
    std::size_t offset = 0;

    auto flush = [&]() {
        std::string content = text::trim(join_lines(lines));
        if (!content.empty()) {
            sections.push_back(MarkdownSection{headers, std::move(content), section_start});
        }
    };

    std::istringstream stream{markdown};
    std::string line;
    while (std::getline(stream, line)) {
        std::smatch match;
        if (std::regex_match(line, match, kHeader)) {
            flush();
            const auto level = static_cast<std::size_t>(match[1].length());
            headers.resize(std::min(headers.size(), level - 1));
            headers.push_back(text::trim(match[2].str()));
            lines.clear();
            section_start = offset;
        } else {
            lines.push_back(line);
        }
        offset += line.size() + 1;
    }
    flush();

    if (sections.empty() && !text::trim(markdown).empty()) {
        sections.push_back(MarkdownSection{{}, text::trim(markdown), 0});
    }
    return sections;
}

std::string join_headers(const std::vector<std::string>& headers) {
    std::string joined;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        if (i > 0) {
            joined.append(" > ");
        }
        joined.append(headers[i]);
    }
    return joined;
}

}  // namespace

void validate(const ChunkConfig& config) {
    if (config.chunk_size == 0) {
        throw InvalidOptionError("chunk_size must be positive");
    }
    if (config.chunk_overlap >= config.chunk_size) {
        throw InvalidOptionError("chunk_overlap must be smaller than chunk_size");
    }
}

std::string sha256_hex(const std::string& content) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), hash);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::vector<TextChunk> chunk_text(const std::string& text, const ChunkConfig& config) {
    validate(config);

    std::vector<TextChunk> chunks;
    const std::string normalized = text::trim(normalize_newlines(text));
    if (normalized.empty()) {
        return chunks;
    }
    if (normalized.size() <= config.chunk_size) {
        chunks.push_back(make_chunk(0, normalized, 0, normalized.size()));
        return chunks;
    }

    std::size_t start = 0;
    std::size_t last_start = 0;
    int position = 0;
    while (start < normalized.size()) {
        // Window bounds are bytes; never cut a multibyte character.
        std::size_t end = text::utf8_floor(normalized, std::min(normalized.size(), start + config.chunk_size));
        if (end <= start) {
            end = text::utf8_ceil(normalized, start + 1);
        }

        // Prefer a separator, but only when it keeps more than half the window.
        if (end < normalized.size()) {
            const std::size_t break_point =
                find_break_point(normalized.substr(start, end - start), config.separators);
            if (break_point * 2 > config.chunk_size) {
                end = start + break_point;
            }
        }

        std::string content = text::trim(std::string_view{normalized}.substr(start, end - start));
        if (!content.empty()) {
            chunks.push_back(make_chunk(position++, std::move(content), start, end));
            last_start = start;
        }
        if (end == normalized.size()) {
            break;
        }

        const std::size_t next =
            text::utf8_floor(normalized, end > config.chunk_overlap ? end - config.chunk_overlap : 0);
        start = (next <= last_start && !chunks.empty()) ? end : next;
    }
    return chunks;
}

std::vector<TextChunk> chunk_markdown(const std::string& markdown, const ChunkConfig& config) {
    validate(config);

    std::vector<TextChunk> chunks;
    int position = 0;
    for (const auto& section : split_by_headers(normalize_newlines(markdown))) {
        const std::string path = join_headers(section.headers);
        const std::string body = path.empty() ? section.content : path + "\n\n" + section.content;

        for (auto& chunk : chunk_text(body, config)) {
            chunk.position = position++;
            chunk.start_index += section.start_index;
            chunk.end_index += section.start_index;
            chunk.headers = section.headers;
            chunks.push_back(std::move(chunk));
        }
    }
    return chunks;
}

std::vector<TextChunk> merge_small_chunks(const std::vector<TextChunk>& chunks, std::size_t min_chunk_size) {
    std::vector<TextChunk> merged;
    if (chunks.empty()) {
        return merged;
    }

    TextChunk current = chunks.front();
    for (std::size_t i = 1; i < chunks.size(); ++i) {
        if (current.content.size() < min_chunk_size) {
            current.content.append("\n\n").append(chunks[i].content);
            current.end_index = chunks[i].end_index;
            continue;
        }
        current.position = static_cast<int>(merged.size());
        current.content_sha256 = sha256_hex(current.content);
        merged.push_back(std::move(current));
        current = chunks[i];
    }
    current.position = static_cast<int>(merged.size());
    current.content_sha256 = sha256_hex(current.content);
    merged.push_back(std::move(current));
    return merged;
}

int estimate_token_count(const std::string& text) {
    return static_cast<int>(std::ceil(static_cast<double>(text::utf8_length(text)) / 3.5));
}

}  // namespace kbengine
