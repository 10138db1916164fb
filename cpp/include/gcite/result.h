// gcite/cpp/include/gcite/result.h
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "gcite/citations.h"
#include "gcite/grounding.h"
#include "gcite/reconcile.h"
#include "gcite/retriever.h"

namespace gcite {

nlohmann::json to_json(const PassageRecord& p);
nlohmann::json to_json(const RetrievedPassage& p);
nlohmann::json to_json(const std::vector<RetrievedPassage>& ps);
nlohmann::json to_json(const SourceEntry& s);
nlohmann::json to_json(const Reconciled& r);
nlohmann::json to_json(const GroundedAnswer& a);

// One citation payload item. Accepts title|label, marker|n; an empty url is
// dropped; date is kept only as YYYY-MM-DD; topics are coerced to strings;
// a missing document_id becomes "url::<url>" or "doc::<hash>".
// Fails (false + err) on a non-object or a missing / non-positive marker.
bool source_entry_from_json(const nlohmann::json& j, SourceEntry& out, std::string* err);

// skip_malformed: drop bad items; otherwise the first bad item fails the call.
bool normalize_citations(const nlohmann::json& items,
                         bool skip_malformed,
                         std::vector<SourceEntry>& out,
                         std::string* err);

} // namespace gcite
