#include "gcite/reader.h"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <string_view>

#include <simdjson.h>

#include "text_common.h"

namespace gcite {

namespace {

static std::string_view get_sv_or_empty(const simdjson::dom::element& doc, const char* key) {
    std::string_view sv{};
    auto err = doc.at_key(key).get(sv);
    if (err) return std::string_view{};
    return sv;
}

// first non-empty string among top-level keys, then meta.<key>
static std::string first_string(const simdjson::dom::element& doc,
                                std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        std::string_view sv = trim_view(get_sv_or_empty(doc, k));
        if (!sv.empty()) return std::string(sv);
    }
    simdjson::dom::element meta;
    if (!doc.at_key("meta").get(meta) && meta.is_object()) {
        for (const char* k : keys) {
            std::string_view sv = trim_view(get_sv_or_empty(meta, k));
            if (!sv.empty()) return std::string(sv);
        }
    }
    return {};
}

static void collect_topics(const simdjson::dom::element& v, std::vector<std::string>& out) {
    std::string_view sv;
    if (!v.get(sv)) {
        sv = trim_view(sv);
        if (!sv.empty()) out.emplace_back(sv);
        return;
    }
    simdjson::dom::array arr;
    if (v.get(arr)) return;
    for (simdjson::dom::element x : arr) {
        std::string_view t;
        if (x.get(t)) continue;
        t = trim_view(t);
        if (!t.empty()) out.emplace_back(t);
    }
}

static std::vector<std::string> read_topics(const simdjson::dom::element& doc) {
    std::vector<std::string> out;
    for (const char* k : {"topics", "tags"}) {
        simdjson::dom::element v;
        if (!doc.at_key(k).get(v)) {
            collect_topics(v, out);
            if (!out.empty()) return out;
        }
    }
    simdjson::dom::element meta;
    if (!doc.at_key("meta").get(meta) && meta.is_object()) {
        simdjson::dom::element v;
        if (!meta.at_key("topics").get(v)) collect_topics(v, out);
    }
    return out;
}

} // namespace

bool load_chunks_jsonl(const std::filesystem::path& path,
                       std::vector<PassageRecord>& out,
                       size_t max_text_bytes,
                       std::string* err) {
    out.clear();

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open " + path.string();
        return false;
    }

    simdjson::dom::parser parser;
    std::string line;
    line.reserve(16 * 1024);
    uint64_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim_view(line).empty()) continue;

        simdjson::dom::element doc;
        auto perr = parser.parse(line).get(doc);
        if (perr) {
            if (err) *err = path.filename().string() + ":" + std::to_string(line_no) +
                            ": invalid JSON (" + simdjson::error_message(perr) + ")";
            return false;
        }
        if (!doc.is_object()) {
            if (err) *err = path.filename().string() + ":" + std::to_string(line_no) +
                            ": record is not a JSON object";
            return false;
        }

        PassageRecord r;
        r.document_id = first_string(doc, {"doc_id", "document_id"});
        r.passage_id = first_string(doc, {"chunk_id", "passage_id", "id"});
        if (r.passage_id.empty()) {
            const std::string row = "row" + std::to_string(out.size());
            r.passage_id = r.document_id.empty() ? row : r.document_id + "::" + row;
        }
        r.title = first_string(doc, {"title"});
        r.url = first_string(doc, {"url", "source"});
        r.date_raw = first_string(doc, {"date"});
        r.date = parse_iso_date(r.date_raw);
        r.county = first_string(doc, {"county", "geo"});
        r.topics = read_topics(doc);

        std::string_view text = get_sv_or_empty(doc, "text");
        if (max_text_bytes > 0 && text.size() > max_text_bytes) {
            text = text.substr(0, utf8_safe_prefix_len(text, max_text_bytes));
        }
        r.text.assign(text.data(), text.size());

        out.push_back(std::move(r));
    }

    if (in.bad()) {
        if (err) *err = "read failed " + path.string();
        return false;
    }
    return true;
}

bool load_embeddings_npy(const std::filesystem::path& path,
                         EmbeddingMatrix& out,
                         std::string* err) {
    out = EmbeddingMatrix{};

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open " + path.string();
        return false;
    }

    NpyHeader h{};
    std::string herr;
    if (!read_npy_header(in, h, &herr)) {
        if (err) *err = path.filename().string() + ": " + herr;
        return false;
    }
    if (h.cols == 0 && h.rows > 0) {
        if (err) *err = path.filename().string() + ": zero embedding dimension";
        return false;
    }
    if (h.cols > (1u << 16)) {
        if (err) *err = path.filename().string() + ": implausible embedding dimension " + std::to_string(h.cols);
        return false;
    }

    std::error_code ec;
    const uint64_t file_bytes = (uint64_t)std::filesystem::file_size(path, ec);
    const std::streamoff data_off = in.tellg();
    if (ec || data_off < 0) {
        if (err) *err = "cannot stat " + path.string();
        return false;
    }
    const uint64_t n = h.rows * h.cols;
    const uint64_t need = n * (uint64_t)h.word_size;
    if (file_bytes - (uint64_t)data_off != need) {
        if (err) *err = path.filename().string() + ": data size mismatch: got=" +
                        std::to_string(file_bytes - (uint64_t)data_off) + " expect=" + std::to_string(need);
        return false;
    }

    out.rows = h.rows;
    out.dim = (uint32_t)h.cols;
    out.data.resize((size_t)n);

    if (h.word_size == 4) {
        in.read(reinterpret_cast<char*>(out.data.data()), (std::streamsize)need);
    } else {
        std::vector<double> tmp(1u << 14);
        uint64_t done = 0;
        while (done < n && in) {
            const uint64_t take = std::min<uint64_t>(tmp.size(), n - done);
            in.read(reinterpret_cast<char*>(tmp.data()), (std::streamsize)(take * sizeof(double)));
            for (uint64_t i = 0; i < take; ++i) out.data[(size_t)(done + i)] = (float)tmp[(size_t)i];
            done += take;
        }
    }
    if (!in) {
        if (err) *err = "failed reading vectors from " + path.string();
        return false;
    }
    return true;
}

} // namespace gcite
