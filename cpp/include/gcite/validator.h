// gcite/cpp/include/gcite/validator.h
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace gcite {

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;
};

// Checks a corpus directory without loading it into a cache. Reports every
// problem found rather than stopping at the first.
ValidationResult validate_corpus(const std::filesystem::path& kb_dir, float norm_tolerance = 1e-3f);

} // namespace gcite
