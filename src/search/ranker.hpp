#pragma once

#include <vector>

#include "core/types.hpp"

namespace kbengine {

enum class Metric {
    Cosine,
    // Scored as 1 / (1 + distance) so that higher still means closer.
    Euclidean,
};

struct RankOptions {
    int top_k = 5;
    double threshold = 0.7;
    Metric metric = Metric::Cosine;
};

inline constexpr int kMinTopK = 1;
inline constexpr int kMaxTopK = 20;

// Throws InvalidOptionError when top_k is outside 1..20 or threshold outside 0..1.
void validate(const RankOptions& options);

// Strict weak order: higher score first, then lower chunk position.
bool result_order(const SearchResult& lhs, const SearchResult& rhs);

// Scores every candidate against the query, drops anything under the threshold and
// returns at most top_k results in result_order. Candidates without an embedding
// are skipped; a candidate of another dimensionality raises DimensionMismatchError.
std::vector<SearchResult> rank(const std::vector<float>& query_vector,
                               const std::vector<Chunk>& candidates,
                               const RankOptions& options);

SearchResult to_search_result(const Chunk& chunk, double score);

}  // namespace kbengine
