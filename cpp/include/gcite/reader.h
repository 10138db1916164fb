// gcite/cpp/include/gcite/reader.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "gcite/format.h"
#include "gcite/passage.h"

namespace gcite {

struct EmbeddingMatrix {
    uint64_t rows{0};
    uint32_t dim{0};
    std::vector<float> data; // rows * dim, row-major
};

// One PassageRecord per non-empty line, in file order. Legacy key spellings
// (source/url, tags/topics, geo/county, meta.*, id/chunk_id) are folded into
// the canonical record here. Text is clipped to max_text_bytes (0 = no limit).
bool load_chunks_jsonl(const std::filesystem::path& path,
                       std::vector<PassageRecord>& out,
                       size_t max_text_bytes,
                       std::string* err);

// float32 or float64 little-endian 2-D .npy; float64 is narrowed to float32.
bool load_embeddings_npy(const std::filesystem::path& path,
                         EmbeddingMatrix& out,
                         std::string* err);

} // namespace gcite
