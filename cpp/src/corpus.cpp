// gcite/cpp/src/corpus.cpp
#include "gcite/corpus.h"
#include "gcite/errors.h"
#include "gcite/format.h"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;

namespace gcite {

Corpus::Corpus(fs::path dir,
               std::vector<PassageRecord> records,
               EmbeddingMatrix vectors,
               CorpusManifest manifest,
               const LoadOptions& opt)
    : dir_(std::move(dir)),
      records_(std::move(records)),
      vectors_(std::move(vectors)),
      manifest_(std::move(manifest)) {
    if (vectors_.rows != records_.size()) {
        throw CorpusLoadError(ErrorCode::InvalidFormat,
                              "vector count " + std::to_string(vectors_.rows) +
                              " != metadata record count " + std::to_string(records_.size()));
    }
    if (opt.build_flat_index && !records_.empty()) {
        FlatIndexOptions fo;
        fo.max_threads = opt.flat_index_threads;
        flat_ = std::make_unique<FlatIpIndex>(vectors_.data.data(), vectors_.rows, vectors_.dim, fo);
    }
}

const PassageRecord& Corpus::get(size_t index) const {
    if (index >= records_.size()) {
        throw std::out_of_range("passage index " + std::to_string(index) +
                                " out of range (size " + std::to_string(records_.size()) + ")");
    }
    return records_[index];
}

const float* Corpus::embedding(size_t index) const {
    if (index >= records_.size()) {
        throw std::out_of_range("embedding index " + std::to_string(index) + " out of range");
    }
    return vectors_.data.data() + index * (size_t)vectors_.dim;
}

fs::path resolve_kb_dir(const fs::path& kb_path) {
    std::error_code ec;
    if (fs::is_directory(kb_path, ec)) return kb_path;
    if (kb_path.has_extension()) return kb_path.parent_path();
    return kb_path;
}

static void check_vectors(const EmbeddingMatrix& m, float tol) {
    for (uint64_t r = 0; r < m.rows; ++r) {
        const float* v = m.data.data() + (size_t)r * m.dim;
        double ss = 0.0;
        for (uint32_t i = 0; i < m.dim; ++i) {
            if (!std::isfinite(v[i])) {
                throw CorpusLoadError(ErrorCode::InvalidFormat,
                                      "non-finite value in vector row " + std::to_string(r));
            }
            ss += (double)v[i] * (double)v[i];
        }
        const double n = std::sqrt(ss);
        if (std::fabs(n - 1.0) > (double)tol) {
            throw CorpusLoadError(ErrorCode::InvalidFormat,
                                  "vector row " + std::to_string(r) + " is not unit-normalized (norm=" +
                                  std::to_string(n) + ")");
        }
    }
}

CorpusHandle load_corpus(const fs::path& kb_path, const LoadOptions& opt) {
    const fs::path dir = resolve_kb_dir(kb_path);

    CorpusManifest manifest;
    std::string err;
    if (!load_manifest(dir, manifest, &err)) {
        throw CorpusLoadError(ErrorCode::InvalidFormat, err);
    }

    const fs::path chunks_path = dir / (manifest.present && !manifest.chunks_file.empty()
                                            ? manifest.chunks_file : std::string(kChunksFile));
    const fs::path vecs_path = dir / (manifest.present && !manifest.embeddings_file.empty()
                                          ? manifest.embeddings_file : std::string(kEmbeddingsFile));

    std::error_code ec;
    if (!fs::exists(chunks_path, ec) || !fs::exists(vecs_path, ec)) {
        throw CorpusLoadError(ErrorCode::CorpusMissing,
                              "missing index files in " + dir.string() + " (need " +
                              chunks_path.filename().string() + " and " + vecs_path.filename().string() + ")");
    }

    std::vector<PassageRecord> records;
    if (!load_chunks_jsonl(chunks_path, records, opt.max_text_bytes, &err)) {
        throw CorpusLoadError(ErrorCode::ParseError, err);
    }

    EmbeddingMatrix vectors;
    if (!load_embeddings_npy(vecs_path, vectors, &err)) {
        throw CorpusLoadError(ErrorCode::InvalidFormat, err);
    }

    if (vectors.rows != records.size()) {
        throw CorpusLoadError(ErrorCode::InvalidFormat,
                              "vector count " + std::to_string(vectors.rows) +
                              " != metadata record count " + std::to_string(records.size()));
    }
    if (manifest.present) {
        if (manifest.count != 0 && manifest.count != vectors.rows) {
            throw CorpusLoadError(ErrorCode::InvalidFormat,
                                  "manifest count " + std::to_string(manifest.count) +
                                  " != vector count " + std::to_string(vectors.rows));
        }
        if (manifest.dim != 0 && manifest.dim != vectors.dim) {
            throw CorpusLoadError(ErrorCode::InvalidFormat,
                                  "manifest dim " + std::to_string(manifest.dim) +
                                  " != vector dim " + std::to_string(vectors.dim));
        }
    }

    std::unordered_set<std::string> seen;
    seen.reserve(records.size() * 2);
    for (const auto& r : records) {
        if (!seen.insert(r.passage_id).second) {
            throw CorpusLoadError(ErrorCode::InvalidFormat, "duplicate passage_id: " + r.passage_id);
        }
    }

    check_vectors(vectors, opt.norm_tolerance);

    return std::make_shared<const Corpus>(dir, std::move(records), std::move(vectors),
                                          std::move(manifest), opt);
}

static fs::path cache_key(const fs::path& kb_path) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(resolve_kb_dir(kb_path), ec);
    if (ec) return resolve_kb_dir(kb_path).lexically_normal();
    return p;
}

CorpusHandle CorpusCache::load(const fs::path& kb_path, const LoadOptions& opt) {
    const fs::path key = cache_key(kb_path);

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (handle_ && key == path_) return handle_;
    }

    // disk load runs unlocked; readers keep the resident corpus meanwhile
    CorpusHandle fresh = load_corpus(key, opt);

    std::lock_guard<std::mutex> lk(mu_);
    if (handle_ && key == path_) return handle_;

    std::cerr << "[gcite] corpus loaded dir=" << key.string()
              << " passages=" << fresh->size()
              << " dim=" << fresh->dim()
              << " flat_index=" << (fresh->flat_index() ? "on" : "off") << "\n";

    path_ = key;
    handle_ = std::move(fresh);
    return handle_;
}

CorpusHandle CorpusCache::current() const {
    std::lock_guard<std::mutex> lk(mu_);
    return handle_;
}

} // namespace gcite
