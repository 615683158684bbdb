#pragma once

#include <cortex/core/types.h>

#include <cstddef>
#include <span>
#include <vector>

namespace cortex::vector::utils {

/**
 * Raw cosine similarity in [-1, 1]. Mismatched dimensions, empty input or a zero-magnitude
 * operand yield 0 instead of dividing by zero.
 */
double cosineSimilarity(std::span<const float> a, std::span<const float> b);

/**
 * Cosine similarity mapped into [0, 1] via (sim + 1) / 2, so orthogonal (0.5) and opposite (0.0)
 * directions stay distinguishable. Degenerate operands score 0.
 */
float normalizedCosine(std::span<const float> a, std::span<const float> b);

/**
 * Normalize a vector to unit length; a zero vector is returned unchanged
 */
std::vector<float> normalizeVector(const std::vector<float>& vec);

double magnitude(std::span<const float> vec);

/**
 * True when the vector has exactly expected_dim finite components
 */
bool isValidEmbedding(std::span<const float> embedding, size_t expected_dim);

/**
 * Little-endian float32 packing used by the SQLite store
 */
std::vector<std::byte> toBlob(std::span<const float> embedding);
Result<std::vector<float>> fromBlob(std::span<const std::byte> blob);

} // namespace cortex::vector::utils
