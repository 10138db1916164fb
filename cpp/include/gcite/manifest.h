#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace gcite {

struct CorpusManifest {
    bool present{false};
    int64_t created{0};          // unix seconds
    std::string chunks_file;
    std::string embeddings_file;
    uint64_t count{0};
    uint64_t dim{0};
    std::string embed_model;
    std::string written_at_utc;  // compact
};

// Missing manifest.json is not an error (out.present == false).
// Returns false only for an unreadable or malformed manifest.
bool load_manifest(const std::filesystem::path& kb_dir, CorpusManifest& out, std::string* err);

bool write_manifest(const std::filesystem::path& kb_dir, const CorpusManifest& m);

} // namespace gcite
