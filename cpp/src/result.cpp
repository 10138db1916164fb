// gcite/cpp/src/result.cpp
#include "gcite/result.h"

#include <cctype>
#include <cstdint>
#include <initializer_list>

#include "text_common.h"

namespace gcite {

nlohmann::json to_json(const PassageRecord& p) {
    nlohmann::json j;
    j["doc_id"] = p.document_id;
    j["chunk_id"] = p.passage_id;
    j["title"] = p.title;
    j["url"] = p.url;
    j["date"] = p.date ? p.date->to_string() : p.date_raw;
    j["county"] = p.county;
    j["topics"] = p.topics;
    j["text"] = p.text;
    return j;
}

nlohmann::json to_json(const RetrievedPassage& p) {
    nlohmann::json j = to_json(p.passage);
    j["index"] = p.index;
    j["score"] = p.score;
    return j;
}

nlohmann::json to_json(const std::vector<RetrievedPassage>& ps) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : ps) arr.push_back(to_json(p));
    return arr;
}

nlohmann::json to_json(const SourceEntry& s) {
    nlohmann::json j;
    j["marker"] = s.marker;
    j["doc_id"] = s.document_id;
    j["title"] = s.title;
    j["url"] = s.url ? nlohmann::json(*s.url) : nlohmann::json(nullptr);
    j["date"] = s.date ? nlohmann::json(*s.date) : nlohmann::json(nullptr);
    j["county"] = s.county ? nlohmann::json(*s.county) : nlohmann::json(nullptr);
    j["topics"] = s.topics;
    return j;
}

nlohmann::json to_json(const Reconciled& r) {
    nlohmann::json j;
    j["body_md"] = r.text;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : r.sources) arr.push_back(to_json(s));
    j["citations"] = std::move(arr);
    return j;
}

nlohmann::json to_json(const GroundedAnswer& a) {
    nlohmann::json j = to_json(a.result);
    j["passages"] = to_json(a.passages);
    return j;
}

namespace {

std::string scalar_to_string(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return std::string();
    return v.dump();
}

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::string();
    return trim_copy(scalar_to_string(*it));
}

bool is_plain_ymd(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit((unsigned char)s[i])) return false;
    }
    return true;
}

bool read_marker(const nlohmann::json& j, int& out) {
    const nlohmann::json* v = nullptr;
    auto it = j.find("marker");
    if (it != j.end() && !it->is_null()) v = &*it;
    if (!v) {
        it = j.find("n");
        if (it != j.end() && !it->is_null()) v = &*it;
    }
    if (!v) return false;
    if (v->is_number_integer()) {
        const int64_t n = v->get<int64_t>();
        if (n < 1 || n > 1000000) return false;
        out = (int)n;
        return true;
    }
    if (v->is_string()) {
        const std::string s = trim_copy(v->get<std::string>());
        if (s.empty() || s.size() > 7) return false;
        for (char c : s) if (!std::isdigit((unsigned char)c)) return false;
        out = std::stoi(s);
        return out >= 1;
    }
    return false;
}

} // namespace

bool source_entry_from_json(const nlohmann::json& j, SourceEntry& out, std::string* err) {
    out = SourceEntry{};
    if (!j.is_object()) {
        if (err) *err = "citation: expected object";
        return false;
    }
    if (!read_marker(j, out.marker)) {
        if (err) *err = "citation: missing or invalid marker";
        return false;
    }

    out.title = string_field(j, "title");
    if (out.title.empty()) out.title = string_field(j, "label");
    if (out.title.empty()) out.title = "Source";

    const std::string url = string_field(j, "url");
    if (!url.empty()) out.url = url;

    const std::string date = string_field(j, "date");
    if (is_plain_ymd(date)) out.date = date;

    const std::string county = string_field(j, "county");
    if (!county.empty()) out.county = county;

    auto tit = j.find("topics");
    if (tit != j.end() && !tit->is_null()) {
        if (tit->is_array()) {
            for (const auto& t : *tit) {
                std::string s = scalar_to_string(t);
                if (!trim_view(s).empty()) out.topics.push_back(std::move(s));
            }
        } else {
            out.topics.push_back(scalar_to_string(*tit));
        }
    }

    out.document_id = string_field(j, "doc_id");
    if (out.document_id.empty()) out.document_id = string_field(j, "document_id");
    if (out.document_id.empty()) {
        if (!url.empty()) {
            out.document_id = "url::" + url;
        } else {
            const std::string seed = out.title + "|" + std::to_string(out.marker);
            out.document_id = "doc::" + hex64(fnv1a64(seed)).substr(0, 12);
        }
    }
    return true;
}

bool normalize_citations(const nlohmann::json& items,
                         bool skip_malformed,
                         std::vector<SourceEntry>& out,
                         std::string* err) {
    out.clear();
    if (items.is_null()) return true;
    if (!items.is_array()) {
        if (err) *err = "citations: expected array";
        return false;
    }
    size_t i = 0;
    for (const auto& it : items) {
        SourceEntry e;
        std::string e_err;
        if (!source_entry_from_json(it, e, &e_err)) {
            if (skip_malformed) {
                ++i;
                continue;
            }
            if (err) *err = "citations[" + std::to_string(i) + "]: " + e_err;
            return false;
        }
        out.push_back(std::move(e));
        ++i;
    }
    return true;
}

} // namespace gcite
