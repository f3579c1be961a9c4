#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "chunk/chunk.hpp"

namespace kbengine {

struct ChunkConfig {
    std::size_t chunk_size = 1000;
    std::size_t chunk_overlap = 200;
    // In order of preference.
    std::vector<std::string> separators = {"\n\n", "\n", ". ", "! ", "? ", "; ", ", ", " "};
};

// Throws InvalidOptionError unless chunk_size > 0 and chunk_overlap < chunk_size.
void validate(const ChunkConfig& config);

std::vector<TextChunk> chunk_text(const std::string& text, const ChunkConfig& config = {});

// Splits at markdown headers first and prefixes every chunk with its "H1 > H2" path.
std::vector<TextChunk> chunk_markdown(const std::string& markdown, const ChunkConfig& config = {});

// Folds every chunk shorter than min_chunk_size into its successor.
std::vector<TextChunk> merge_small_chunks(const std::vector<TextChunk>& chunks, std::size_t min_chunk_size = 200);

// Roughly 3.5 characters per token.
int estimate_token_count(const std::string& text);

std::string sha256_hex(const std::string& content);

}  // namespace kbengine
