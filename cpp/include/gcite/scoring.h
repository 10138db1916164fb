#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gcite {

struct ScoredIndex {
    uint32_t index{0}; // corpus row
    float score{0.0f};
};

// Plain sequential accumulation; every search path scores through this so the
// flat index and direct computation agree bit for bit.
inline float dot_f32(const float* a, const float* b, size_t d) {
    float s = 0.0f;
    for (size_t i = 0; i < d; ++i) s += a[i] * b[i];
    return s;
}

// Descending score, ties by ascending corpus index.
inline bool ranks_before(const ScoredIndex& a, const ScoredIndex& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.index < b.index;
}

// Keeps the best k entries of v, sorted by ranks_before.
void select_top_k(std::vector<ScoredIndex>& v, size_t k);

} // namespace gcite
