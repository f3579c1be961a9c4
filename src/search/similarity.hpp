#pragma once

#include <vector>

namespace kbengine {

// dot(a, b) / (|a| * |b|). Returns 0 when either vector has zero norm.
// Throws DimensionMismatchError when the lengths differ.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Throws DimensionMismatchError when the lengths differ.
double euclidean_distance(const std::vector<float>& a, const std::vector<float>& b);

}  // namespace kbengine
