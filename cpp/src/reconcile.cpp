// gcite/cpp/src/reconcile.cpp
#include "gcite/reconcile.h"

#include <cctype>
#include <unordered_map>
#include <unordered_set>

#include "text_common.h"

namespace gcite {

namespace {

struct MarkerSpan {
    size_t pos{0};   // '['
    size_t len{0};   // through ']'
    int value{0};
};

constexpr size_t kMaxMarkerDigits = 9;

std::vector<MarkerSpan> find_markers(std::string_view s) {
    std::vector<MarkerSpan> out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '[') continue;
        size_t j = i + 1;
        while (j < s.size() && std::isdigit((unsigned char)s[j])) ++j;
        const size_t nd = j - i - 1;
        if (nd == 0 || nd > kMaxMarkerDigits || j >= s.size() || s[j] != ']') continue;
        MarkerSpan m;
        m.pos = i;
        m.len = j - i + 1;
        m.value = std::stoi(std::string(s.substr(i + 1, nd)));
        out.push_back(m);
        i = j;
    }
    return out;
}

bool starts_with_keyword(std::string_view s, std::string_view& rest) {
    static const char* kKeywords[] = {"references", "reference", "sources", "source"};
    for (const char* kw : kKeywords) {
        const std::string_view k(kw);
        if (s.size() < k.size()) continue;
        bool eq = true;
        for (size_t i = 0; i < k.size(); ++i) {
            if (std::tolower((unsigned char)s[i]) != k[i]) { eq = false; break; }
        }
        if (!eq) continue;
        rest = s.substr(k.size());
        return true;
    }
    return false;
}

std::string_view strip_bold(std::string_view s) {
    while (!s.empty() && (s.front() == '*' || s.front() == '_')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == '*' || s.back() == '_')) s.remove_suffix(1);
    return trim_view(s);
}

bool is_sources_line(std::string_view line) {
    std::string_view s = trim_view(line);
    bool heading = false;
    while (!s.empty() && s.front() == '#') {
        heading = true;
        s.remove_prefix(1);
    }
    s = strip_bold(trim_view(s));

    std::string_view rest;
    if (!starts_with_keyword(s, rest)) return false;
    rest = strip_bold(rest);

    if (heading) {
        return rest.empty() || !std::isalnum((unsigned char)rest.front());
    }
    return rest.empty() || rest.front() == ':';
}

std::string rtrim_copy(std::string_view s) {
    size_t e = s.size();
    while (e > 0 && std::isspace((unsigned char)s[e - 1])) --e;
    return std::string(s.substr(0, e));
}

} // namespace

std::string strip_model_sources_section(std::string_view text) {
    size_t pos = 0;
    bool first = true;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) nl = text.size();
        if (!first && is_sources_line(text.substr(pos, nl - pos))) {
            return rtrim_copy(text.substr(0, pos));
        }
        first = false;
        pos = nl + 1;
    }
    return std::string(text);
}

std::string strip_markers(std::string_view text) {
    const auto spans = find_markers(text);
    std::string out;
    out.reserve(text.size());
    size_t from = 0;
    for (const auto& m : spans) {
        size_t ws = m.pos;
        while (ws > from && std::isspace((unsigned char)text[ws - 1])) --ws;
        out.append(text.substr(from, ws - from));
        from = m.pos + m.len;
    }
    out.append(text.substr(from));
    return out;
}

Reconciled reconcile(std::string_view text, const std::vector<SourceEntry>& grounding_sources) {
    Reconciled r;
    const std::string body = strip_model_sources_section(text);

    if (grounding_sources.empty()) {
        r.text = strip_markers(body);
        return r;
    }

    std::unordered_map<int, const SourceEntry*> by_marker;
    for (const auto& s : grounding_sources) by_marker.emplace(s.marker, &s);

    const auto spans = find_markers(body);

    // numbers still shown by ungrounded markers; never handed to a source
    std::unordered_set<int> taken;
    for (const auto& m : spans)
        if (!by_marker.count(m.value)) taken.insert(m.value);

    // old marker -> new marker, grounded markers only, in first-use order
    std::unordered_map<int, int> renum;
    int next = 0;
    for (const auto& m : spans) {
        if (renum.count(m.value)) continue;
        auto it = by_marker.find(m.value);
        if (it == by_marker.end()) continue;
        do {
            ++next;
        } while (taken.count(next));
        renum.emplace(m.value, next);
        SourceEntry e = *it->second;
        e.marker = next;
        r.sources.push_back(std::move(e));
    }

    r.text.reserve(body.size());
    size_t from = 0;
    for (const auto& m : spans) {
        auto it = renum.find(m.value);
        if (it == renum.end()) continue;
        r.text.append(body, from, m.pos - from);
        r.text += "[" + std::to_string(it->second) + "]";
        from = m.pos + m.len;
    }
    r.text.append(body, from, std::string::npos);
    return r;
}

} // namespace gcite
