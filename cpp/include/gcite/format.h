#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace gcite {

constexpr const char* kChunksFile     = "chunks.jsonl";
constexpr const char* kEmbeddingsFile = "embeddings.npy";
constexpr const char* kManifestFile   = "manifest.json";

// .npy v1/v2/v3 header, 2-D row-major matrices only.
struct NpyHeader {
    uint8_t  major{1};
    uint8_t  minor{0};
    char     dtype{'f'};    // 'f' only
    uint32_t word_size{4};  // 4 (float32) or 8 (float64)
    bool     fortran_order{false};
    uint64_t rows{0};
    uint64_t cols{0};
};

// Reads the header and leaves the stream at the first data byte.
// Byte order must be little-endian ('<' or '|').
bool read_npy_header(std::ifstream& in, NpyHeader& out, std::string* err);
bool write_npy_header(std::ofstream& out, const NpyHeader& h);

std::string utc_now_compact();

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin);

} // namespace gcite
