// gcite/cpp/include/gcite/flat_index.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "gcite/scoring.h"

namespace gcite {

struct FlatIndexOptions {
    unsigned max_threads{0};         // 0 => hardware_concurrency
    uint32_t min_rows_per_thread{4096};
};

// Exact inner-product index over the full corpus matrix. The matrix is owned by
// the corpus and must outlive the index. Only valid for unrestricted searches.
class FlatIpIndex {
public:
    FlatIpIndex(const float* data, uint64_t rows, uint32_t dim, FlatIndexOptions opt = {});

    uint64_t rows() const { return rows_; }
    uint32_t dim() const { return dim_; }
    unsigned threads() const { return threads_; }

    // Top-k over all rows; k is clamped to rows().
    std::vector<ScoredIndex> search(const float* query, size_t k) const;

private:
    void scan(const float* query, uint64_t begin, uint64_t end, size_t k,
              std::vector<ScoredIndex>& out) const;

    const float* data_{nullptr};
    uint64_t rows_{0};
    uint32_t dim_{0};
    unsigned threads_{1};
};

} // namespace gcite
