#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "gcite/filter.h"
#include "test_util.h"

static void test_topic_and_county() {
    auto r = mk_rec("A", "a0", "2025-03-01", "Buncombe", {"Housing", "food"});

    gcite::RetrieveFilter f;
    assert(gcite::matches(r, f));

    f.topics = std::vector<std::string>{"housing"};
    assert(gcite::matches(r, f));
    f.topics = std::vector<std::string>{"roads", "FOOD"};
    assert(gcite::matches(r, f));
    f.topics = std::vector<std::string>{"roads"};
    assert(!gcite::matches(r, f));
    f.topics = std::vector<std::string>{};
    assert(gcite::matches(r, f));

    f.counties = std::vector<std::string>{"buncombe", "Yancey"};
    assert(gcite::matches(r, f));
    f.counties = std::vector<std::string>{"Yancey"};
    assert(!gcite::matches(r, f));

    auto no_county = mk_rec("B", "b0", "2025-03-01", "", {"housing"});
    f.counties = std::vector<std::string>{"Yancey"};
    assert(!gcite::matches(no_county, f));

    // both predicates must hold
    f.topics = std::vector<std::string>{"housing"};
    f.counties = std::vector<std::string>{"Buncombe"};
    assert(gcite::matches(r, f));
    assert(!gcite::matches(no_county, f));
}

static void test_non_ascii_folding() {
    auto r = mk_rec("N", "n0", "2025-03-01", "Ñuble", {"Énergie", "ЁЛКА"});
    gcite::RetrieveFilter f;
    f.counties = std::vector<std::string>{"ñuble"};
    assert(gcite::matches(r, f));
    f.counties = std::vector<std::string>{"nuble"};
    assert(!gcite::matches(r, f));

    f.counties.reset();
    f.topics = std::vector<std::string>{"énergie"};
    assert(gcite::matches(r, f));
    f.topics = std::vector<std::string>{"ёлка"};
    assert(gcite::matches(r, f));

    auto ru = mk_rec("R", "r0", "2025-03-01", "МОСКВА");
    f.topics.reset();
    f.counties = std::vector<std::string>{" москва "};
    assert(gcite::matches(ru, f));
}

static void test_date_window_strict() {
    auto before = mk_rec("A", "a", "2024-12-31");
    auto on = mk_rec("B", "b", "2025-01-01");
    auto undated = mk_rec("C", "c", "");
    auto junk = mk_rec("D", "d", "sometime in 2025");

    gcite::RetrieveFilter f;
    assert(gcite::matches(undated, f));
    assert(gcite::matches(junk, f));

    f.date_from = gcite::parse_iso_date("2025-01-01");
    assert(!gcite::matches(before, f));
    assert(gcite::matches(on, f));
    assert(!gcite::matches(undated, f));
    assert(!gcite::matches(junk, f));

    gcite::RetrieveFilter g;
    g.date_to = gcite::parse_iso_date("2025-01-01");
    assert(gcite::matches(before, g));
    assert(gcite::matches(on, g));
    assert(!gcite::matches(undated, g));

    g.date_from = gcite::parse_iso_date("2025-01-01");
    assert(!gcite::matches(before, g));
    assert(gcite::matches(on, g));
}

static void test_idempotent() {
    auto r = mk_rec("A", "a", "2025-02-02", "Yancey", {"roads"});
    gcite::RetrieveFilter f;
    f.topics = std::vector<std::string>{"Roads"};
    f.date_to = gcite::parse_iso_date("2025-12-31");
    const bool first = gcite::matches(r, f);
    for (int i = 0; i < 5; ++i) assert(gcite::matches(r, f) == first);
    assert(first);
}

static void test_parse_filter_json() {
    gcite::RetrieveFilter f;
    std::string err;

    auto j = nlohmann::json::parse(R"({"topic":"housing","county":["Buncombe",""],"date":{"from":"2025-01-01","to":"2025-06-30T00:00"}})");
    assert(gcite::parse_filter_json(j, f, &err));
    assert(f.topics && f.topics->size() == 1 && (*f.topics)[0] == "housing");
    assert(f.counties && f.counties->size() == 1 && (*f.counties)[0] == "Buncombe");
    assert(f.date_from && f.date_from->to_string() == "2025-01-01");
    assert(f.date_to && f.date_to->to_string() == "2025-06-30");

    j = nlohmann::json::parse(R"({"topics":[],"date_from":""})");
    assert(gcite::parse_filter_json(j, f, &err));
    assert(!f.topics && !f.counties && !f.has_date_bound());

    j = nlohmann::json::parse(R"({"date_from":"2025-02-30"})");
    assert(!gcite::parse_filter_json(j, f, &err));
    assert(err.find("date_from") != std::string::npos);

    j = nlohmann::json::parse(R"({"topics":[1,2]})");
    assert(!gcite::parse_filter_json(j, f, &err));

    j = nlohmann::json::parse(R"(["housing"])");
    assert(!gcite::parse_filter_json(j, f, &err));
}

int main() {
    test_topic_and_county();
    test_non_ascii_folding();
    test_date_window_strict();
    test_idempotent();
    test_parse_filter_json();
    std::cout << "OK\n";
    return 0;
}
