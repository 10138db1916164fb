// gcite/cpp/src/manifest.cpp
#include "gcite/manifest.h"
#include "gcite/format.h"

#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gcite {

static bool write_text_file_tmp(const std::filesystem::path& tmp, const std::string& content) {
    std::ofstream out(tmp, std::ios::binary);
    if (!out) return false;
    out.write(content.data(), (std::streamsize)content.size());
    out.flush();
    return (bool)out;
}

bool load_manifest(const std::filesystem::path& kb_dir, CorpusManifest& out, std::string* err) {
    out = CorpusManifest{};
    const auto p = kb_dir / kManifestFile;

    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) return true;

    std::ifstream in(p);
    if (!in) {
        if (err) *err = "cannot open " + p.string();
        return false;
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        if (err) *err = "failed parsing " + p.string() + ": " + e.what();
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = "manifest is not an object";
        return false;
    }

    try {
        out.created = j.value("created", (int64_t)0);
        out.chunks_file = j.value("chunks_file", std::string(kChunksFile));
        out.embeddings_file = j.value("embeddings_file", std::string(kEmbeddingsFile));
        out.count = j.value("count", (uint64_t)0);
        out.dim = j.value("dim", (uint64_t)0);
        if (j.contains("embed_model") && j["embed_model"].is_string()) {
            out.embed_model = j["embed_model"].get<std::string>();
        }
        out.written_at_utc = j.value("written_at_utc", std::string());
    } catch (const json::exception& e) {
        if (err) *err = "invalid manifest field: " + std::string(e.what());
        return false;
    }
    out.present = true;
    return true;
}

bool write_manifest(const std::filesystem::path& kb_dir, const CorpusManifest& m) {
    const auto fin = kb_dir / kManifestFile;
    const auto tmp = kb_dir / (std::string(kManifestFile) + ".tmp");

    json j;
    j["created"] = m.created;
    j["chunks_file"] = m.chunks_file.empty() ? std::string(kChunksFile) : m.chunks_file;
    j["embeddings_file"] = m.embeddings_file.empty() ? std::string(kEmbeddingsFile) : m.embeddings_file;
    j["count"] = m.count;
    j["dim"] = m.dim;
    j["embed_model"] = m.embed_model;
    j["written_at_utc"] = m.written_at_utc;

    if (!write_text_file_tmp(tmp, j.dump(2))) return false;
    return atomic_replace_file_best_effort(tmp, fin);
}

} // namespace gcite
