#pragma once
// VectorMath.hpp
// Cosine similarity and normalization over float embeddings.

#include <vector>

// In [-1, 1]; 0.0 when either vector has zero norm or the sizes differ
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Scales to unit length; zero vectors are left untouched
void normalize_vector(std::vector<float>& vec);

double vector_norm(const std::vector<float>& vec);
