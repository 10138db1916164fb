// gcite/cpp/src/corpus_writer.cpp
#include "gcite/corpus_writer.h"
#include "gcite/embedding.h"
#include "gcite/errors.h"
#include "gcite/format.h"
#include "gcite/manifest.h"

#include <chrono>
#include <fstream>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace gcite {

namespace {

struct TmpCleanupOnFail {
    std::vector<fs::path> paths;
    bool keep{false};
    ~TmpCleanupOnFail() {
        if (keep) return;
        std::error_code ec;
        for (const auto& p : paths) fs::remove(p, ec);
    }
};

nlohmann::json record_line(const PassageRecord& r) {
    nlohmann::json j;
    j["doc_id"] = r.document_id;
    j["chunk_id"] = r.passage_id;
    j["title"] = r.title;
    j["url"] = r.url;
    j["date"] = !r.date_raw.empty() ? r.date_raw : (r.date ? r.date->to_string() : std::string());
    j["county"] = r.county;
    j["topics"] = r.topics;
    j["text"] = r.text;
    return j;
}

} // namespace

WriteStats write_corpus(const fs::path& out_dir,
                        const std::vector<PassageRecord>& records,
                        const std::vector<std::vector<float>>& vectors,
                        const WriteOptions& opt) {
    if (records.size() != vectors.size()) {
        throw GciteException(ErrorCode::InvalidArgs,
                             "records/vectors size mismatch: " + std::to_string(records.size()) +
                             " vs " + std::to_string(vectors.size()));
    }
    const uint32_t dim = vectors.empty() ? 0u : (uint32_t)vectors.front().size();
    if (!vectors.empty() && dim == 0) {
        throw GciteException(ErrorCode::InvalidArgs, "zero-dimension vectors");
    }

    std::vector<float> mat;
    mat.reserve(vectors.size() * (size_t)dim);
    for (size_t i = 0; i < vectors.size(); ++i) {
        std::vector<float> v = vectors[i];
        if (v.size() != dim) {
            throw GciteException(ErrorCode::InvalidArgs,
                                 "vector " + std::to_string(i) + " has dim " + std::to_string(v.size()) +
                                 ", expected " + std::to_string(dim));
        }
        if (opt.normalize && !l2_normalize(v)) {
            throw GciteException(ErrorCode::InvalidArgs,
                                 "vector " + std::to_string(i) + " is zero or non-finite");
        }
        mat.insert(mat.end(), v.begin(), v.end());
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) throw GciteException(ErrorCode::IoError, "cannot create " + out_dir.string() + ": " + ec.message());

    const fs::path chunks_fin = out_dir / kChunksFile;
    const fs::path vecs_fin = out_dir / kEmbeddingsFile;
    const fs::path chunks_tmp = out_dir / (std::string(kChunksFile) + ".tmp");
    const fs::path vecs_tmp = out_dir / (std::string(kEmbeddingsFile) + ".tmp");

    TmpCleanupOnFail cleanup;
    cleanup.paths = {chunks_tmp, vecs_tmp};

    {
        std::ofstream out(chunks_tmp, std::ios::binary);
        if (!out) throw GciteException(ErrorCode::IoError, "cannot open " + chunks_tmp.string());
        for (const auto& r : records) {
            out << record_line(r).dump() << '\n';
        }
        out.flush();
        if (!out) throw GciteException(ErrorCode::IoError, "write failed " + chunks_tmp.string());
    }

    {
        std::ofstream out(vecs_tmp, std::ios::binary);
        if (!out) throw GciteException(ErrorCode::IoError, "cannot open " + vecs_tmp.string());
        NpyHeader h;
        h.word_size = 4;
        h.rows = vectors.size();
        h.cols = dim;
        if (!write_npy_header(out, h)) throw GciteException(ErrorCode::IoError, "npy header write failed");
        if (!mat.empty()) {
            out.write(reinterpret_cast<const char*>(mat.data()), (std::streamsize)(mat.size() * sizeof(float)));
        }
        out.flush();
        if (!out) throw GciteException(ErrorCode::IoError, "write failed " + vecs_tmp.string());
    }

    if (!atomic_replace_file_best_effort(chunks_tmp, chunks_fin))
        throw GciteException(ErrorCode::IoError, "atomic replace failed (chunks)");
    if (!atomic_replace_file_best_effort(vecs_tmp, vecs_fin))
        throw GciteException(ErrorCode::IoError, "atomic replace failed (embeddings)");

    WriteStats st;
    st.dir = out_dir;
    st.count = records.size();
    st.dim = dim;
    st.written_at_utc = utc_now_compact();

    if (opt.write_manifest) {
        CorpusManifest m;
        m.present = true;
        m.created = (int64_t)std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::system_clock::now().time_since_epoch()).count();
        m.chunks_file = kChunksFile;
        m.embeddings_file = kEmbeddingsFile;
        m.count = st.count;
        m.dim = dim;
        m.embed_model = opt.embed_model;
        m.written_at_utc = st.written_at_utc;
        if (!write_manifest(out_dir, m)) throw GciteException(ErrorCode::IoError, "manifest write failed");
    }

    cleanup.keep = true;
    return st;
}

} // namespace gcite
