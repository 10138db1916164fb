// gcite/cpp/src/flat_index.cpp
#include "gcite/flat_index.h"

#include <algorithm>
#include <thread>

namespace gcite {

void select_top_k(std::vector<ScoredIndex>& v, size_t k) {
    if (k == 0) {
        v.clear();
        return;
    }
    if (v.size() > k) {
        std::nth_element(v.begin(), v.begin() + (std::ptrdiff_t)(k - 1), v.end(), ranks_before);
        v.resize(k);
    }
    std::sort(v.begin(), v.end(), ranks_before);
}

FlatIpIndex::FlatIpIndex(const float* data, uint64_t rows, uint32_t dim, FlatIndexOptions opt)
    : data_(data), rows_(rows), dim_(dim) {
    unsigned hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 4;
    unsigned max_thr = (opt.max_threads > 0 ? opt.max_threads : hw);

    const uint32_t per = std::max<uint32_t>(1u, opt.min_rows_per_thread);
    const uint64_t by_rows = std::max<uint64_t>(1ull, rows_ / per);
    threads_ = (unsigned)std::min<uint64_t>(max_thr, by_rows);
    if (threads_ == 0) threads_ = 1;
}

void FlatIpIndex::scan(const float* query, uint64_t begin, uint64_t end, size_t k,
                       std::vector<ScoredIndex>& out) const {
    out.clear();
    out.reserve((size_t)(end - begin));
    for (uint64_t r = begin; r < end; ++r) {
        const float s = dot_f32(query, data_ + (size_t)r * dim_, dim_);
        out.push_back(ScoredIndex{(uint32_t)r, s});
    }
    select_top_k(out, k);
}

std::vector<ScoredIndex> FlatIpIndex::search(const float* query, size_t k) const {
    std::vector<ScoredIndex> out;
    k = std::min<uint64_t>(k, rows_);
    if (k == 0) return out;

    if (threads_ <= 1) {
        scan(query, 0, rows_, k, out);
        return out;
    }

    // each worker keeps its local top-k; the merge re-selects over the union
    std::vector<std::vector<ScoredIndex>> partial(threads_);
    std::vector<std::thread> workers;
    workers.reserve(threads_);

    const uint64_t step = (rows_ + threads_ - 1) / threads_;
    for (unsigned t = 0; t < threads_; ++t) {
        const uint64_t b = std::min<uint64_t>(rows_, (uint64_t)t * step);
        const uint64_t e = std::min<uint64_t>(rows_, b + step);
        workers.emplace_back([this, query, b, e, k, &partial, t]() {
            scan(query, b, e, k, partial[t]);
        });
    }
    for (auto& th : workers) th.join();

    out.reserve((size_t)k * threads_);
    for (auto& p : partial) out.insert(out.end(), p.begin(), p.end());
    select_top_k(out, k);
    return out;
}

} // namespace gcite
