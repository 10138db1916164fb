// gcite/cpp/include/gcite/reconcile.h
#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "gcite/citations.h"

namespace gcite {

struct Reconciled {
    std::string text;
    std::vector<SourceEntry> sources; // ascending markers in first-use order
};

// Cuts a self-authored "Sources" / "References" section (a heading line or a
// "Sources:" label line, never the first line) through end of text.
std::string strip_model_sources_section(std::string_view text);

// Removes every [n] marker together with the whitespace before it.
std::string strip_markers(std::string_view text);

// Renumbers grounded [n] markers to first-use order and reorders the sources
// to match. Markers with no matching source stay as written, and their
// numbers are skipped when numbering grounded ones. Sources never referenced
// are dropped. With no sources, all markers are stripped.
Reconciled reconcile(std::string_view text, const std::vector<SourceEntry>& grounding_sources);

} // namespace gcite
