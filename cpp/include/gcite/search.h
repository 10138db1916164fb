// gcite/cpp/include/gcite/search.h
#pragma once
#include <cstdint>
#include <vector>

#include "gcite/corpus.h"
#include "gcite/passage.h"

namespace gcite {

struct RankedHit {
    uint32_t index{0};
    float score{0.0f};
    const PassageRecord* passage{nullptr}; // points into the corpus
};

// Direct scoring over exactly the given candidates. k is clamped to
// candidates.size(); empty candidates yield an empty result.
// throws EmbeddingDimensionMismatchError, std::out_of_range for a bad index
std::vector<RankedHit> search(const Corpus& corpus,
                              const std::vector<float>& query,
                              const std::vector<uint32_t>& candidates,
                              size_t k);

// Whole corpus. Uses the flat index when the corpus has one and use_flat is set.
std::vector<RankedHit> search_all(const Corpus& corpus,
                                  const std::vector<float>& query,
                                  size_t k,
                                  bool use_flat = true);

} // namespace gcite
