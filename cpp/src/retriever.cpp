// gcite/cpp/src/retriever.cpp
#include "gcite/retriever.h"
#include "gcite/errors.h"

namespace gcite {

std::vector<RankedHit> dedupe_adjacent_by_doc(const std::vector<RankedHit>& hits) {
    std::vector<RankedHit> out;
    out.reserve(hits.size());
    const std::string* last = nullptr;
    for (const auto& h : hits) {
        const std::string& doc = h.passage->document_id;
        if (!doc.empty() && last && *last == doc) continue;
        out.push_back(h);
        last = &doc;
    }
    return out;
}

Retriever::Retriever(CorpusHandle corpus, EmbeddingProvider& embedder, RetrieveOptions opt)
    : fixed_(std::move(corpus)), embedder_(embedder), opt_(opt) {}

Retriever::Retriever(const CorpusCache& cache, EmbeddingProvider& embedder, RetrieveOptions opt)
    : cache_(&cache), embedder_(embedder), opt_(opt) {}

CorpusHandle Retriever::corpus() const {
    CorpusHandle h = cache_ ? cache_->current() : fixed_;
    if (!h) throw CorpusNotReadyError("corpus not loaded");
    return h;
}

std::vector<RetrievedPassage> Retriever::retrieve(const std::string& query,
                                                  const std::optional<RetrieveFilter>& filter,
                                                  size_t k) const {
    CorpusHandle c = corpus();
    if (c->size() == 0 || k == 0) return {};
    return run(*c, embedder_.embed(query), filter, k);
}

std::vector<RetrievedPassage> Retriever::retrieve(const std::string& query,
                                                  const std::optional<RetrieveFilter>& filter) const {
    return retrieve(query, filter, opt_.top_k);
}

std::vector<RetrievedPassage> Retriever::retrieve_vector(std::vector<float> query,
                                                         const std::optional<RetrieveFilter>& filter,
                                                         size_t k) const {
    CorpusHandle c = corpus();
    if (c->size() == 0 || k == 0) return {};
    return run(*c, std::move(query), filter, k);
}

std::future<std::vector<RetrievedPassage>> Retriever::retrieve_async(std::string query,
                                                                     std::optional<RetrieveFilter> filter,
                                                                     size_t k) const {
    return std::async(std::launch::async,
                      [this, q = std::move(query), f = std::move(filter), k]() {
                          return retrieve(q, f, k);
                      });
}

std::vector<RetrievedPassage> Retriever::run(const Corpus& corpus,
                                             std::vector<float> query,
                                             const std::optional<RetrieveFilter>& filter,
                                             size_t k) const {
    if (query.size() != corpus.dim()) {
        throw EmbeddingDimensionMismatchError(corpus.dim(), query.size());
    }
    if (!l2_normalize(query)) {
        throw GciteException(ErrorCode::InvalidArgs, "query embedding is zero or non-finite");
    }

    std::vector<RankedHit> hits;
    if (!filter) {
        hits = search_all(corpus, query, k, opt_.use_flat_index);
    } else {
        std::vector<uint32_t> cand = candidate_indices(corpus, *filter);
        if (cand.empty()) return {};
        if (cand.size() == corpus.size()) {
            hits = search_all(corpus, query, k, opt_.use_flat_index);
        } else {
            hits = search(corpus, query, cand, k);
        }
    }

    if (opt_.dedupe_adjacent) hits = dedupe_adjacent_by_doc(hits);
    if (hits.size() > k) hits.resize(k);

    std::vector<RetrievedPassage> out;
    out.reserve(hits.size());
    for (const auto& h : hits) {
        RetrievedPassage p;
        p.index = h.index;
        p.score = h.score;
        p.passage = *h.passage;
        out.push_back(std::move(p));
    }
    return out;
}

} // namespace gcite
