// gcite/cpp/include/gcite/embedding.h
#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace gcite {

// External collaborator; may block.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

// In-place L2 normalization. Returns false for a zero or non-finite vector
// (left unchanged).
bool l2_normalize(std::vector<float>& v);

// Lookup table of precomputed query vectors (evaluation tool, tests).
// Unknown text throws std::out_of_range.
class StaticEmbeddingProvider : public EmbeddingProvider {
public:
    // false when text is already registered with a different vector; the
    // first entry is kept. Re-adding an identical vector is accepted.
    bool add(const std::string& text, std::vector<float> vec);
    std::vector<float> embed(const std::string& text) override;

private:
    std::unordered_map<std::string, std::vector<float>> table_;
};

} // namespace gcite
