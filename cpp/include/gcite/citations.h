// gcite/cpp/include/gcite/citations.h
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gcite/passage.h"
#include "gcite/retriever.h"

namespace gcite {

struct SourceEntry {
    int marker{0}; // >= 1
    std::string document_id;
    std::string title;
    std::optional<std::string> url;
    std::optional<std::string> date; // YYYY-MM-DD
    std::optional<std::string> county;
    std::vector<std::string> topics;
};

// document key -> marker, one request only
using MarkerMap = std::unordered_map<std::string, int>;

struct CitationSet {
    MarkerMap markers;
    std::vector<SourceEntry> sources;      // first-encounter order, markers 1..n
    std::vector<int> passage_markers;      // marker of each input passage, same order
};

// document_id, else "url|title" when either is set, else "doc::" + 12 hex of
// fnv1a64("|Source"), so passages with no identity at all share one source.
std::string source_key(const PassageRecord& p);

CitationSet build_sources(const std::vector<RetrievedPassage>& passages);
CitationSet build_sources(const std::vector<PassageRecord>& passages);

// Blank-line separated paragraphs, trimmed, empties dropped.
std::vector<std::string> paragraph_blocks(std::string_view text);

// Appends " [n]" to each block unless n equals the previous block's marker;
// markers <= 0 append nothing. Blocks are joined with a blank line.
std::string insert_markers(const std::vector<std::string>& blocks, const std::vector<int>& markers);

// Prompt context: "[n] title (date)\nsnippet\nURL: url" per passage, n being
// the passage's document marker.
std::string format_context_blocks(const std::vector<RetrievedPassage>& passages,
                                  const CitationSet& citations,
                                  size_t snippet_bytes = 600);

} // namespace gcite
