#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kbengine {

// A passage of a source document before embedding. Indices are byte offsets into the
// normalized document text.
struct TextChunk {
    int position = 0;
    std::string content;
    std::size_t start_index = 0;
    std::size_t end_index = 0;
    std::string content_sha256;
    // Markdown section path, outermost header first.
    std::vector<std::string> headers;
};

}  // namespace kbengine
