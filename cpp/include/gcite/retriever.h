// gcite/cpp/include/gcite/retriever.h
#pragma once
#include <future>
#include <optional>
#include <string>
#include <vector>

#include "gcite/corpus.h"
#include "gcite/embedding.h"
#include "gcite/filter.h"
#include "gcite/search.h"

namespace gcite {

struct RetrieveOptions {
    size_t top_k{8};
    bool use_flat_index{true};
    bool dedupe_adjacent{true};
};

// Owns a copy of the record so it stays valid if the cache swaps corpora.
struct RetrievedPassage {
    uint32_t index{0};
    float score{0.0f};
    PassageRecord passage;
};

// Drops a hit whose document_id equals the previous kept hit's. Empty
// document ids never collapse.
std::vector<RankedHit> dedupe_adjacent_by_doc(const std::vector<RankedHit>& hits);

class Retriever {
public:
    // Fixed corpus; a null handle makes every call throw CorpusNotReadyError.
    Retriever(CorpusHandle corpus, EmbeddingProvider& embedder, RetrieveOptions opt = {});

    // Uses whatever the cache holds at call time.
    Retriever(const CorpusCache& cache, EmbeddingProvider& embedder, RetrieveOptions opt = {});

    const RetrieveOptions& options() const { return opt_; }

    // throws CorpusNotReadyError, EmbeddingDimensionMismatchError,
    // GciteException(InvalidArgs) for a zero or non-finite query vector
    std::vector<RetrievedPassage> retrieve(const std::string& query,
                                           const std::optional<RetrieveFilter>& filter,
                                           size_t k) const;
    std::vector<RetrievedPassage> retrieve(const std::string& query,
                                           const std::optional<RetrieveFilter>& filter = std::nullopt) const;

    // Vector is normalized here; callers need not pre-normalize.
    std::vector<RetrievedPassage> retrieve_vector(std::vector<float> query,
                                                  const std::optional<RetrieveFilter>& filter,
                                                  size_t k) const;

    // Runs retrieve on a separate thread. The retriever, its embedder and its
    // corpus source must outlive the future.
    std::future<std::vector<RetrievedPassage>> retrieve_async(std::string query,
                                                              std::optional<RetrieveFilter> filter,
                                                              size_t k) const;

private:
    CorpusHandle corpus() const;
    std::vector<RetrievedPassage> run(const Corpus& corpus,
                                      std::vector<float> query,
                                      const std::optional<RetrieveFilter>& filter,
                                      size_t k) const;

    CorpusHandle fixed_;
    const CorpusCache* cache_{nullptr};
    EmbeddingProvider& embedder_;
    RetrieveOptions opt_;
};

} // namespace gcite
