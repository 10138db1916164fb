// gcite/cpp/src/citations.cpp
#include "gcite/citations.h"

#include "text_common.h"

namespace gcite {

std::string source_key(const PassageRecord& p) {
    if (!p.document_id.empty()) return p.document_id;
    if (!p.url.empty() || !p.title.empty()) return p.url + "|" + p.title;
    // every bare passage shares the one placeholder source
    return "doc::" + hex64(fnv1a64("|Source")).substr(0, 12);
}

static SourceEntry make_entry(const PassageRecord& p, int marker) {
    SourceEntry e;
    e.marker = marker;
    e.document_id = p.document_id;
    if (!p.title.empty()) e.title = p.title;
    else if (!p.document_id.empty()) e.title = p.document_id;
    else e.title = "Source";
    if (!p.url.empty()) e.url = p.url;
    if (p.date) e.date = p.date->to_string();
    if (!p.county.empty()) e.county = p.county;
    e.topics = p.topics;
    return e;
}

template <class Get>
static CitationSet build_impl(size_t n, Get get) {
    CitationSet cs;
    cs.passage_markers.reserve(n);
    int next = 1;
    for (size_t i = 0; i < n; ++i) {
        const PassageRecord& p = get(i);
        std::string key = source_key(p);
        auto it = cs.markers.find(key);
        if (it != cs.markers.end()) {
            cs.passage_markers.push_back(it->second);
            continue;
        }
        SourceEntry e = make_entry(p, next);
        if (e.document_id.empty()) e.document_id = key;
        cs.markers.emplace(std::move(key), next);
        cs.sources.push_back(std::move(e));
        cs.passage_markers.push_back(next);
        ++next;
    }
    return cs;
}

CitationSet build_sources(const std::vector<RetrievedPassage>& passages) {
    return build_impl(passages.size(), [&](size_t i) -> const PassageRecord& { return passages[i].passage; });
}

CitationSet build_sources(const std::vector<PassageRecord>& passages) {
    return build_impl(passages.size(), [&](size_t i) -> const PassageRecord& { return passages[i]; });
}

std::vector<std::string> paragraph_blocks(std::string_view text) {
    std::vector<std::string> out;
    std::string cur;
    bool blank_run = false;

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) nl = text.size();
        std::string_view line = text.substr(pos, nl - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (trim_view(line).empty()) {
            blank_run = true;
        } else {
            if (blank_run && !cur.empty()) {
                std::string p = trim_copy(cur);
                if (!p.empty()) out.push_back(std::move(p));
                cur.clear();
            }
            blank_run = false;
            if (!cur.empty()) cur.push_back('\n');
            cur.append(line.data(), line.size());
        }
        pos = nl + 1;
    }
    std::string p = trim_copy(cur);
    if (!p.empty()) out.push_back(std::move(p));
    return out;
}

std::string insert_markers(const std::vector<std::string>& blocks, const std::vector<int>& markers) {
    std::string out;
    int prev = 0;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i) out += "\n\n";
        out += blocks[i];
        const int n = (i < markers.size()) ? markers[i] : 0;
        if (n > 0 && n != prev) {
            out += " [";
            out += std::to_string(n);
            out += "]";
        }
        prev = n;
    }
    return out;
}

std::string format_context_blocks(const std::vector<RetrievedPassage>& passages,
                                  const CitationSet& citations,
                                  size_t snippet_bytes) {
    std::string out;
    for (size_t i = 0; i < passages.size(); ++i) {
        const PassageRecord& p = passages[i].passage;
        const int n = (i < citations.passage_markers.size()) ? citations.passage_markers[i] : (int)(i + 1);

        std::string title = p.title;
        if (title.empty()) title = p.url;
        if (title.empty()) title = "Source " + std::to_string(n);

        const std::string date = p.date ? p.date->to_string() : p.date_raw;
        const size_t cut = utf8_safe_prefix_len(p.text, snippet_bytes);

        if (i) out += "\n\n";
        out += "[" + std::to_string(n) + "] " + title + " (" + date + ")\n";
        out.append(p.text, 0, cut);
        out += "\nURL: " + p.url;
    }
    return out;
}

} // namespace gcite
