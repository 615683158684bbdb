#include <cortex/vector/vector_utils.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <cstring>

namespace cortex::vector::utils {

double cosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    // Rounding can push |sim| marginally past 1
    return std::clamp(dot_product / (norm_a * norm_b), -1.0, 1.0);
}

float normalizedCosine(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size() || a.empty() || magnitude(a) == 0.0 || magnitude(b) == 0.0) {
        return 0.0f;
    }
    return static_cast<float>((cosineSimilarity(a, b) + 1.0) / 2.0);
}

std::vector<float> normalizeVector(const std::vector<float>& vec) {
    double norm = magnitude(vec);
    if (norm == 0.0) {
        return vec;
    }

    std::vector<float> normalized;
    normalized.reserve(vec.size());
    for (float v : vec) {
        normalized.push_back(static_cast<float>(v / norm));
    }
    return normalized;
}

double magnitude(std::span<const float> vec) {
    double sum = 0.0;
    for (float v : vec) {
        sum += static_cast<double>(v) * static_cast<double>(v);
    }
    return std::sqrt(sum);
}

bool isValidEmbedding(std::span<const float> embedding, size_t expected_dim) {
    if (embedding.size() != expected_dim) {
        return false;
    }
    for (float v : embedding) {
        if (!std::isfinite(v)) {
            return false;
        }
    }
    return true;
}

std::vector<std::byte> toBlob(std::span<const float> embedding) {
    std::vector<std::byte> blob(embedding.size() * sizeof(float));
    for (size_t i = 0; i < embedding.size(); ++i) {
        auto bits = std::bit_cast<uint32_t>(embedding[i]);
        for (size_t b = 0; b < sizeof(float); ++b) {
            blob[i * sizeof(float) + b] = static_cast<std::byte>((bits >> (8 * b)) & 0xFFu);
        }
    }
    return blob;
}

Result<std::vector<float>> fromBlob(std::span<const std::byte> blob) {
    if (blob.size() % sizeof(float) != 0) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding blob size " + std::to_string(blob.size()) +
                         " is not a multiple of 4"};
    }

    std::vector<float> embedding(blob.size() / sizeof(float));
    for (size_t i = 0; i < embedding.size(); ++i) {
        uint32_t bits = 0;
        for (size_t b = 0; b < sizeof(float); ++b) {
            bits |= static_cast<uint32_t>(blob[i * sizeof(float) + b]) << (8 * b);
        }
        embedding[i] = std::bit_cast<float>(bits);
    }
    return embedding;
}

} // namespace cortex::vector::utils
