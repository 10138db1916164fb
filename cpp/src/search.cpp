// gcite/cpp/src/search.cpp
#include "gcite/search.h"
#include "gcite/errors.h"

#include <algorithm>
#include <stdexcept>

namespace gcite {

static void check_dim(const Corpus& corpus, const std::vector<float>& query) {
    if (query.size() != corpus.dim()) {
        throw EmbeddingDimensionMismatchError(corpus.dim(), query.size());
    }
}

static std::vector<RankedHit> to_hits(const Corpus& corpus, const std::vector<ScoredIndex>& top) {
    std::vector<RankedHit> out;
    out.reserve(top.size());
    for (const auto& s : top) {
        RankedHit h;
        h.index = s.index;
        h.score = s.score;
        h.passage = &corpus.get(s.index);
        out.push_back(h);
    }
    return out;
}

std::vector<RankedHit> search(const Corpus& corpus,
                              const std::vector<float>& query,
                              const std::vector<uint32_t>& candidates,
                              size_t k) {
    if (candidates.empty() || k == 0) return {};
    check_dim(corpus, query);

    std::vector<ScoredIndex> scored;
    scored.reserve(candidates.size());
    for (uint32_t idx : candidates) {
        if (idx >= corpus.size()) {
            throw std::out_of_range("candidate index " + std::to_string(idx) + " out of range");
        }
        scored.push_back(ScoredIndex{idx, dot_f32(query.data(), corpus.embedding(idx), corpus.dim())});
    }
    select_top_k(scored, std::min(k, candidates.size()));
    return to_hits(corpus, scored);
}

std::vector<RankedHit> search_all(const Corpus& corpus,
                                  const std::vector<float>& query,
                                  size_t k,
                                  bool use_flat) {
    if (corpus.size() == 0 || k == 0) return {};
    check_dim(corpus, query);

    const FlatIpIndex* flat = corpus.flat_index();
    if (use_flat && flat) {
        return to_hits(corpus, flat->search(query.data(), k));
    }

    std::vector<uint32_t> all(corpus.size());
    for (size_t i = 0; i < all.size(); ++i) all[i] = (uint32_t)i;
    return search(corpus, query, all, k);
}

} // namespace gcite
