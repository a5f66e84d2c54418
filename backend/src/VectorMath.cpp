#include "VectorMath.hpp"
#include <algorithm>
#include <cmath>

double vector_norm(const std::vector<float>& vec) {
    double norm = 0.0;
    for (float x : vec) {
        norm += static_cast<double>(x) * x;
    }
    return std::sqrt(norm);
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    // Rounding can push |cos| slightly past 1
    double similarity = dot_product / (norm_a * norm_b);
    return std::max(-1.0, std::min(1.0, similarity));
}

void normalize_vector(std::vector<float>& vec) {
    double norm = vector_norm(vec);
    if (norm > 0.0) {
        for (float& x : vec) {
            x = static_cast<float>(x / norm);
        }
    }
}
