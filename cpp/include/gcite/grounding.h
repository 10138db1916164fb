// gcite/cpp/include/gcite/grounding.h
#pragma once
#include <future>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gcite/citations.h"
#include "gcite/reconcile.h"
#include "gcite/retriever.h"

namespace gcite {

struct GenerationRequest {
    std::string query;
    std::string context; // rendered context blocks
    std::vector<RetrievedPassage> passages;
};

struct GenerationOutput {
    std::string text;
    nlohmann::json reported_sources = nlohmann::json::array(); // ignored
};

// External collaborator; may block.
class GenerationProvider {
public:
    virtual ~GenerationProvider() = default;
    virtual GenerationOutput generate(const GenerationRequest& req) = 0;
};

enum class GroundingMode {
    ModelMarkers,         // keep the generator's own [n] (numbered like the context blocks)
    ParagraphAttribution, // paragraph i is attributed to passage min(i, n-1)
};

struct GroundingOptions {
    GroundingMode mode{GroundingMode::ModelMarkers};
    size_t snippet_bytes{600};
};

extern const char* const kNoContext;

Reconciled ground_text(const std::string& raw,
                       const std::vector<RetrievedPassage>& passages,
                       GroundingMode mode);

struct GroundedAnswer {
    Reconciled result;
    std::vector<RetrievedPassage> passages;
};

// retrieve -> context blocks -> generate -> ground
GroundedAnswer generate_grounded(const Retriever& retriever,
                                 GenerationProvider& generator,
                                 const std::string& query,
                                 const std::optional<RetrieveFilter>& filter,
                                 size_t k,
                                 const GroundingOptions& opt = {});

// The retriever and generator must outlive the future.
std::future<GroundedAnswer> generate_grounded_async(const Retriever& retriever,
                                                    GenerationProvider& generator,
                                                    std::string query,
                                                    std::optional<RetrieveFilter> filter,
                                                    size_t k,
                                                    GroundingOptions opt = {});

} // namespace gcite
