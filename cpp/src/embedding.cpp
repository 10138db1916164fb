// gcite/cpp/src/embedding.cpp
#include "gcite/embedding.h"

#include <cmath>
#include <stdexcept>

namespace gcite {

bool l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) {
        if (!std::isfinite(x)) return false;
        ss += (double)x * (double)x;
    }
    if (ss <= 0.0) return false;
    const double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)((double)x * inv);
    return true;
}

bool StaticEmbeddingProvider::add(const std::string& text, std::vector<float> vec) {
    auto it = table_.find(text);
    if (it != table_.end()) return it->second == vec;
    table_.emplace(text, std::move(vec));
    return true;
}

std::vector<float> StaticEmbeddingProvider::embed(const std::string& text) {
    auto it = table_.find(text);
    if (it == table_.end()) {
        throw std::out_of_range("no embedding for query: " + text);
    }
    return it->second;
}

} // namespace gcite
