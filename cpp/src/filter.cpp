// gcite/cpp/src/filter.cpp
#include "gcite/filter.h"
#include "gcite/corpus.h"

#include "text_common.h"

namespace gcite {

namespace {

bool contains_folded(const std::vector<std::string>& wanted, const std::string& folded) {
    std::string tmp;
    for (const auto& w : wanted) {
        fold_case_utf8_to(trim_view(w), tmp);
        if (tmp == folded) return true;
    }
    return false;
}

bool topic_ok(const PassageRecord& rec, const RetrieveFilter& f) {
    if (!f.topics || f.topics->empty()) return true;
    std::string folded;
    for (const auto& t : rec.topics) {
        fold_case_utf8_to(trim_view(t), folded);
        if (folded.empty()) continue;
        if (contains_folded(*f.topics, folded)) return true;
    }
    return false;
}

bool county_ok(const PassageRecord& rec, const RetrieveFilter& f) {
    if (!f.counties || f.counties->empty()) return true;
    const std::string folded = fold_case_utf8(trim_view(rec.county));
    if (folded.empty()) return false;
    return contains_folded(*f.counties, folded);
}

bool date_ok(const PassageRecord& rec, const RetrieveFilter& f) {
    if (!f.has_date_bound()) return true;
    if (!rec.date) return false;
    if (f.date_from && *rec.date < *f.date_from) return false;
    if (f.date_to && *f.date_to < *rec.date) return false;
    return true;
}

bool read_string_list(const nlohmann::json& v, std::vector<std::string>& out,
                      const char* key, std::string* err) {
    out.clear();
    if (v.is_null()) return true;
    if (v.is_string()) {
        std::string s = trim_copy(v.get<std::string>());
        if (!s.empty()) out.push_back(std::move(s));
        return true;
    }
    if (v.is_array()) {
        for (const auto& e : v) {
            if (!e.is_string()) {
                if (err) *err = std::string("filter: ") + key + " must contain strings";
                return false;
            }
            std::string s = trim_copy(e.get<std::string>());
            if (!s.empty()) out.push_back(std::move(s));
        }
        return true;
    }
    if (err) *err = std::string("filter: ") + key + " must be a string or array";
    return false;
}

bool read_date(const nlohmann::json& v, std::optional<Date>& out, const char* key, std::string* err) {
    out.reset();
    if (v.is_null()) return true;
    if (!v.is_string()) {
        if (err) *err = std::string("filter: ") + key + " must be a string";
        return false;
    }
    const std::string s = trim_copy(v.get<std::string>());
    if (s.empty()) return true;
    out = parse_iso_date(s);
    if (!out) {
        if (err) *err = std::string("filter: bad date in ") + key + ": " + s;
        return false;
    }
    return true;
}

const nlohmann::json* first_present(const nlohmann::json& j, const char* a, const char* b) {
    auto it = j.find(a);
    if (it != j.end() && !it->is_null()) return &*it;
    it = j.find(b);
    if (it != j.end() && !it->is_null()) return &*it;
    return nullptr;
}

} // namespace

bool matches(const PassageRecord& rec, const RetrieveFilter& f) {
    return topic_ok(rec, f) && county_ok(rec, f) && date_ok(rec, f);
}

std::vector<uint32_t> candidate_indices(const Corpus& corpus, const RetrieveFilter& f) {
    std::vector<uint32_t> out;
    const auto& recs = corpus.records();
    for (size_t i = 0; i < recs.size(); ++i) {
        if (matches(recs[i], f)) out.push_back((uint32_t)i);
    }
    return out;
}

bool parse_filter_json(const nlohmann::json& j, RetrieveFilter& out, std::string* err) {
    out = RetrieveFilter{};
    if (j.is_null()) return true;
    if (!j.is_object()) {
        if (err) *err = "filter: expected object";
        return false;
    }

    std::vector<std::string> list;
    if (const auto* v = first_present(j, "topics", "topic")) {
        if (!read_string_list(*v, list, "topics", err)) return false;
        if (!list.empty()) out.topics = list;
    }
    if (const auto* v = first_present(j, "counties", "county")) {
        if (!read_string_list(*v, list, "counties", err)) return false;
        if (!list.empty()) out.counties = list;
    }

    const nlohmann::json null_json;
    const nlohmann::json* from = first_present(j, "date_from", "from");
    const nlohmann::json* to = first_present(j, "date_to", "to");
    auto dit = j.find("date");
    if (dit != j.end() && dit->is_object()) {
        auto f = dit->find("from");
        if (!from && f != dit->end()) from = &*f;
        auto t = dit->find("to");
        if (!to && t != dit->end()) to = &*t;
    }
    if (!read_date(from ? *from : null_json, out.date_from, "date_from", err)) return false;
    if (!read_date(to ? *to : null_json, out.date_to, "date_to", err)) return false;
    return true;
}

} // namespace gcite
