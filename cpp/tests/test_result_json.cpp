#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gcite/result.h"
#include "test_util.h"

static void test_source_entry_aliases() {
    gcite::SourceEntry e;
    std::string err;

    auto j = nlohmann::json::parse(R"({"label":"FEMA update","n":2,"url":"  ","date":"2025-01-05T10:00","topics":"housing"})");
    assert(gcite::source_entry_from_json(j, e, &err));
    assert(e.title == "FEMA update");
    assert(e.marker == 2);
    assert(!e.url);
    assert(!e.date);
    assert(e.topics.size() == 1 && e.topics[0] == "housing");
    assert(e.document_id.rfind("doc::", 0) == 0 && e.document_id.size() == 17);

    j = nlohmann::json::parse(R"({"title":"Roads","marker":"3","url":"https://ncdot.gov","date":"2024-11-15","topics":["a",""," ",7]})");
    assert(gcite::source_entry_from_json(j, e, &err));
    assert(e.marker == 3);
    assert(e.url && *e.url == "https://ncdot.gov");
    assert(e.date && *e.date == "2024-11-15");
    assert(e.document_id == "url::https://ncdot.gov");
    assert((e.topics == std::vector<std::string>{"a", "7"}));

    j = nlohmann::json::parse(R"({"doc_id":"fema","marker":1})");
    assert(gcite::source_entry_from_json(j, e, &err));
    assert(e.document_id == "fema");
    assert(e.title == "Source");

    assert(!gcite::source_entry_from_json(nlohmann::json::parse(R"({"title":"no marker"})"), e, &err));
    assert(!gcite::source_entry_from_json(nlohmann::json::parse(R"({"marker":0})"), e, &err));
    assert(!gcite::source_entry_from_json(nlohmann::json::parse(R"({"marker":"two"})"), e, &err));
    assert(!gcite::source_entry_from_json(nlohmann::json::parse(R"("just a string")"), e, &err));
}

static void test_normalize_citations() {
    auto items = nlohmann::json::parse(R"([{"title":"A","marker":1},{"title":"bad"},{"label":"C","n":3}])");
    std::vector<gcite::SourceEntry> out;
    std::string err;

    assert(gcite::normalize_citations(items, true, out, &err));
    assert(out.size() == 2);
    assert(out[0].title == "A" && out[1].title == "C");

    assert(!gcite::normalize_citations(items, false, out, &err));
    assert(err.find("citations[1]") == 0);

    assert(gcite::normalize_citations(nlohmann::json(), false, out, &err));
    assert(out.empty());
    assert(!gcite::normalize_citations(nlohmann::json::object(), true, out, &err));
}

static void test_to_json() {
    gcite::RetrievedPassage p;
    p.index = 4;
    p.score = 0.5f;
    p.passage = mk_rec("A", "a0", "2025-01-01", "Buncombe", {"housing"});
    auto pj = gcite::to_json(p);
    assert(pj["doc_id"] == "A");
    assert(pj["chunk_id"] == "a0");
    assert(pj["index"] == 4);
    assert(pj["score"].get<double>() == 0.5);
    assert(pj["date"] == "2025-01-01");

    gcite::Reconciled r;
    r.text = "Fact [1].";
    gcite::SourceEntry s;
    s.marker = 1;
    s.document_id = "A";
    s.title = "Title A";
    r.sources.push_back(s);
    auto rj = gcite::to_json(r);
    assert(rj["body_md"] == "Fact [1].");
    assert(rj["citations"].size() == 1);
    assert(rj["citations"][0]["marker"] == 1);
    assert(rj["citations"][0]["url"].is_null());

    // serialized citations parse back through the boundary normalizer
    std::vector<gcite::SourceEntry> back;
    std::string err;
    assert(gcite::normalize_citations(rj["citations"], false, back, &err));
    assert(back.size() == 1 && back[0].document_id == "A" && back[0].title == "Title A");
}

int main() {
    test_source_entry_aliases();
    test_normalize_citations();
    test_to_json();
    std::cout << "OK\n";
    return 0;
}
