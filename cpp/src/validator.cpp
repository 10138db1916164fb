// gcite/cpp/src/validator.cpp
#include "gcite/validator.h"
#include "gcite/corpus.h"
#include "gcite/format.h"
#include "gcite/manifest.h"
#include "gcite/reader.h"

#include <cmath>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace gcite {

static void check_norms(const EmbeddingMatrix& m, float tol, std::vector<std::string>& errors) {
    uint64_t bad_finite = 0, bad_norm = 0;
    uint64_t first_finite = 0, first_norm = 0;
    double first_norm_val = 0.0;

    for (uint64_t r = 0; r < m.rows; ++r) {
        const float* v = m.data.data() + (size_t)r * m.dim;
        double ss = 0.0;
        bool finite = true;
        for (uint32_t i = 0; i < m.dim; ++i) {
            if (!std::isfinite(v[i])) { finite = false; break; }
            ss += (double)v[i] * (double)v[i];
        }
        if (!finite) {
            if (bad_finite++ == 0) first_finite = r;
            continue;
        }
        const double n = std::sqrt(ss);
        if (std::fabs(n - 1.0) > (double)tol) {
            if (bad_norm++ == 0) {
                first_norm = r;
                first_norm_val = n;
            }
        }
    }

    if (bad_finite) {
        std::ostringstream oss;
        oss << "non-finite vectors: " << bad_finite << " (first row " << first_finite << ")";
        errors.push_back(oss.str());
    }
    if (bad_norm) {
        std::ostringstream oss;
        oss << "vectors not unit-normalized: " << bad_norm << " (first row " << first_norm
            << ", norm=" << first_norm_val << ")";
        errors.push_back(oss.str());
    }
}

ValidationResult validate_corpus(const fs::path& kb_path, float norm_tolerance) {
    ValidationResult vr;
    const fs::path dir = resolve_kb_dir(kb_path);
    std::string err;

    CorpusManifest m;
    if (!load_manifest(dir, m, &err)) {
        vr.errors.push_back(err);
        m = CorpusManifest{};
    }

    const fs::path chunks_path = dir / (m.present && !m.chunks_file.empty() ? m.chunks_file : std::string(kChunksFile));
    const fs::path vecs_path = dir / (m.present && !m.embeddings_file.empty() ? m.embeddings_file : std::string(kEmbeddingsFile));

    std::error_code ec;
    const bool have_chunks = fs::exists(chunks_path, ec);
    const bool have_vecs = fs::exists(vecs_path, ec);
    if (!have_chunks) vr.errors.push_back("missing " + chunks_path.filename().string());
    if (!have_vecs) vr.errors.push_back("missing " + vecs_path.filename().string());

    std::vector<PassageRecord> records;
    bool records_ok = false;
    if (have_chunks) {
        records_ok = load_chunks_jsonl(chunks_path, records, 0, &err);
        if (!records_ok) vr.errors.push_back(err);
    }

    EmbeddingMatrix vectors;
    bool vectors_ok = false;
    if (have_vecs) {
        vectors_ok = load_embeddings_npy(vecs_path, vectors, &err);
        if (!vectors_ok) vr.errors.push_back(err);
    }

    if (records_ok) {
        std::unordered_set<std::string> seen;
        uint64_t dup = 0, bad_dates = 0;
        std::string first_dup, first_bad_date;
        for (const auto& r : records) {
            if (!seen.insert(r.passage_id).second && dup++ == 0) first_dup = r.passage_id;
            if (!r.date_raw.empty() && !r.date && bad_dates++ == 0) first_bad_date = r.date_raw;
        }
        if (dup) {
            vr.errors.push_back("duplicate passage ids: " + std::to_string(dup) + " (first " + first_dup + ")");
        }
        if (bad_dates) {
            vr.errors.push_back("unparseable dates: " + std::to_string(bad_dates) + " (first \"" + first_bad_date + "\")");
        }
    }

    if (vectors_ok) {
        check_norms(vectors, norm_tolerance, vr.errors);
    }

    if (records_ok && vectors_ok && vectors.rows != records.size()) {
        std::ostringstream oss;
        oss << "count mismatch: vectors=" << vectors.rows << " records=" << records.size();
        vr.errors.push_back(oss.str());
    }

    if (m.present) {
        if (vectors_ok && m.count != 0 && m.count != vectors.rows) {
            vr.errors.push_back("manifest count " + std::to_string(m.count) +
                                " != vectors " + std::to_string(vectors.rows));
        }
        if (vectors_ok && m.dim != 0 && m.dim != vectors.dim) {
            vr.errors.push_back("manifest dim " + std::to_string(m.dim) +
                                " != vectors dim " + std::to_string(vectors.dim));
        }
    }

    vr.ok = vr.errors.empty();
    return vr;
}

} // namespace gcite
