// gcite/cpp/include/gcite/corpus_writer.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "gcite/passage.h"

namespace gcite {

struct WriteOptions {
    std::string embed_model;  // recorded in manifest.json
    bool write_manifest{true};
    bool normalize{true};     // L2-normalize rows before writing
};

struct WriteStats {
    std::filesystem::path dir;
    uint64_t count{0};
    uint32_t dim{0};
    std::string written_at_utc;
};

// Writes chunks.jsonl, embeddings.npy (float32, C order) and manifest.json into
// out_dir via tmp files + atomic replace. Temporaries are removed on failure.
// throws GciteException (InvalidArgs for shape / zero / non-finite vectors,
// IoError for write failures)
WriteStats write_corpus(const std::filesystem::path& out_dir,
                        const std::vector<PassageRecord>& records,
                        const std::vector<std::vector<float>>& vectors,
                        const WriteOptions& opt = {});

} // namespace gcite
