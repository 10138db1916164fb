// gcite/cpp/include/gcite/corpus.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gcite/flat_index.h"
#include "gcite/manifest.h"
#include "gcite/passage.h"
#include "gcite/reader.h"

namespace gcite {

struct LoadOptions {
    size_t max_text_bytes{64u * 1024u}; // per passage, UTF-8 safe truncation
    float norm_tolerance{1e-3f};        // |L2 norm - 1| allowed per vector
    bool build_flat_index{true};
    unsigned flat_index_threads{0};     // 0 => auto
};

// Immutable after construction; shared read-only across requests.
class Corpus {
public:
    Corpus(std::filesystem::path dir,
           std::vector<PassageRecord> records,
           EmbeddingMatrix vectors,
           CorpusManifest manifest,
           const LoadOptions& opt);

    Corpus(const Corpus&) = delete;
    Corpus& operator=(const Corpus&) = delete;

    size_t size() const { return records_.size(); }
    uint32_t dim() const { return vectors_.dim; }

    // throws std::out_of_range
    const PassageRecord& get(size_t index) const;
    const float* embedding(size_t index) const;

    const std::vector<PassageRecord>& records() const { return records_; }
    const std::filesystem::path& dir() const { return dir_; }
    const CorpusManifest& manifest() const { return manifest_; }

    // nullptr when disabled
    const FlatIpIndex* flat_index() const { return flat_.get(); }

private:
    std::filesystem::path dir_;
    std::vector<PassageRecord> records_;
    EmbeddingMatrix vectors_;
    CorpusManifest manifest_;
    std::unique_ptr<FlatIpIndex> flat_;
};

using CorpusHandle = std::shared_ptr<const Corpus>;

// A file path (legacy) resolves to its parent directory.
std::filesystem::path resolve_kb_dir(const std::filesystem::path& kb_path);

// Reads chunks.jsonl + embeddings.npy (+ optional manifest.json) from kb_path.
// throws CorpusLoadError (ErrorCode::CorpusMissing when the files are absent)
CorpusHandle load_corpus(const std::filesystem::path& kb_path, const LoadOptions& opt = {});

// Load-once cache: the same path returns the resident corpus, a different path
// replaces it. A failed load leaves the previous corpus installed. Loading
// happens outside the lock; when two threads load the same path, the first
// installed handle is returned to both.
class CorpusCache {
public:
    CorpusHandle load(const std::filesystem::path& kb_path, const LoadOptions& opt = {});

    // nullptr before the first successful load
    CorpusHandle current() const;

private:
    mutable std::mutex mu_;
    std::filesystem::path path_;
    CorpusHandle handle_;
};

} // namespace gcite
