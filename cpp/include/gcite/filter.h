// gcite/cpp/include/gcite/filter.h
#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gcite/passage.h"

namespace gcite {

class Corpus;

// Absent field => no constraint. An empty list is treated as absent.
struct RetrieveFilter {
    std::optional<std::vector<std::string>> topics;
    std::optional<std::vector<std::string>> counties;
    std::optional<Date> date_from;
    std::optional<Date> date_to;

    bool has_date_bound() const { return date_from.has_value() || date_to.has_value(); }
};

// Case-insensitive topic intersection, county membership, strict date window.
bool matches(const PassageRecord& rec, const RetrieveFilter& f);

// Ascending corpus indices of matching records.
std::vector<uint32_t> candidate_indices(const Corpus& corpus, const RetrieveFilter& f);

// Accepts topics|topic, counties|county (string or array), date_from/date_to
// or date:{from,to}. Unparseable dates fail.
bool parse_filter_json(const nlohmann::json& j, RetrieveFilter& out, std::string* err);

} // namespace gcite
