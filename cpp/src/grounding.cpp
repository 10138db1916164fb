// gcite/cpp/src/grounding.cpp
#include "gcite/grounding.h"

#include <algorithm>

namespace gcite {

const char* const kNoContext = "No context available.";

Reconciled ground_text(const std::string& raw,
                       const std::vector<RetrievedPassage>& passages,
                       GroundingMode mode) {
    const std::string body = strip_model_sources_section(raw);
    const CitationSet cs = build_sources(passages);

    if (mode == GroundingMode::ModelMarkers || passages.empty()) {
        return reconcile(body, cs.sources);
    }

    const std::vector<std::string> paras = paragraph_blocks(strip_markers(body));
    std::vector<int> markers;
    markers.reserve(paras.size());
    for (size_t i = 0; i < paras.size(); ++i) {
        markers.push_back(cs.passage_markers[std::min(i, passages.size() - 1)]);
    }
    return reconcile(insert_markers(paras, markers), cs.sources);
}

GroundedAnswer generate_grounded(const Retriever& retriever,
                                 GenerationProvider& generator,
                                 const std::string& query,
                                 const std::optional<RetrieveFilter>& filter,
                                 size_t k,
                                 const GroundingOptions& opt) {
    GroundedAnswer ans;
    ans.passages = retriever.retrieve(query, filter, k);

    GenerationRequest req;
    req.query = query;
    if (ans.passages.empty()) {
        req.context = kNoContext;
    } else {
        req.context = format_context_blocks(ans.passages, build_sources(ans.passages), opt.snippet_bytes);
    }
    req.passages = ans.passages;

    const GenerationOutput out = generator.generate(req);
    ans.result = ground_text(out.text, ans.passages, opt.mode);
    return ans;
}

std::future<GroundedAnswer> generate_grounded_async(const Retriever& retriever,
                                                    GenerationProvider& generator,
                                                    std::string query,
                                                    std::optional<RetrieveFilter> filter,
                                                    size_t k,
                                                    GroundingOptions opt) {
    return std::async(std::launch::async,
                      [&retriever, &generator, q = std::move(query), f = std::move(filter), k, opt]() {
                          return generate_grounded(retriever, generator, q, f, k, opt);
                      });
}

} // namespace gcite
