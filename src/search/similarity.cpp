#include "search/similarity.hpp"

#include <cmath>

#include "core/errors.hpp"

namespace kbengine {
namespace {

void require_same_dimensions(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError(a.size(), b.size());
    }
}

}  // namespace

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    require_same_dimensions(a, b);

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const double x = a[i];
        const double y = b[i];
        dot += x * y;
        norm_a += x * x;
        norm_b += y * y;
    }
    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

double euclidean_distance(const std::vector<float>& a, const std::vector<float>& b) {
    require_same_dimensions(a, b);

    double sum = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

}  // namespace kbengine
