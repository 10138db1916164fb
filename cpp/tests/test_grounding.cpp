#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "gcite/grounding.h"
#include "test_util.h"

namespace {

class ScriptedGenerator : public gcite::GenerationProvider {
public:
    explicit ScriptedGenerator(std::string reply) : reply_(std::move(reply)) {}

    gcite::GenerationOutput generate(const gcite::GenerationRequest& req) override {
        last_ = req;
        ++calls_;
        gcite::GenerationOutput out;
        out.text = reply_;
        out.reported_sources = nlohmann::json::array({{{"label", "made up"}, {"url", "http://nowhere"}}});
        return out;
    }

    const gcite::GenerationRequest& last() const { return last_; }
    int calls() const { return calls_; }

private:
    std::string reply_;
    gcite::GenerationRequest last_;
    int calls_{0};
};

gcite::RetrievedPassage rp(gcite::PassageRecord r) {
    gcite::RetrievedPassage p;
    p.passage = std::move(r);
    return p;
}

} // namespace

static void test_ground_text_modes() {
    std::vector<gcite::RetrievedPassage> ps = {rp(mk_rec("A", "a0")), rp(mk_rec("B", "b0")), rp(mk_rec("C", "c0"))};

    auto mm = gcite::ground_text("Need is high [3]. Roads closed [1][3].\n\nSources:\n[1] x", ps,
                                 gcite::GroundingMode::ModelMarkers);
    assert(mm.text == "Need is high [1]. Roads closed [2][1].");
    assert(mm.sources.size() == 2);
    assert(mm.sources[0].document_id == "C" && mm.sources[0].marker == 1);
    assert(mm.sources[1].document_id == "A" && mm.sources[1].marker == 2);

    std::vector<gcite::RetrievedPassage> ps2 = {rp(mk_rec("A", "a0")), rp(mk_rec("A", "a1")), rp(mk_rec("B", "b0"))};
    auto pa = gcite::ground_text("One [9].\n\nTwo.\n\nThree.\n\nFour.\n\n## References\n- x", ps2,
                                 gcite::GroundingMode::ParagraphAttribution);
    assert(pa.text == "One. [1]\n\nTwo.\n\nThree. [2]\n\nFour.");
    assert(pa.sources.size() == 2);
    assert(pa.sources[0].document_id == "A");
    assert(pa.sources[1].document_id == "B");

    auto none = gcite::ground_text("Claim [1].\n\nSources: [1] x", {}, gcite::GroundingMode::ParagraphAttribution);
    assert(none.text == "Claim.");
    assert(none.sources.empty());
}

static void test_generate_grounded() {
    std::vector<gcite::PassageRecord> recs = {
        mk_rec("A", "a0", "2025-01-01"), mk_rec("B", "b0"), mk_rec("A", "a1"),
    };
    auto corpus = gcite::load_corpus(write_fixture("grounding", recs, {unit_at(0.1), unit_at(0.2), unit_at(0.3)}));

    gcite::StaticEmbeddingProvider emb;
    emb.add("housing need", {1.0f, 0.0f, 0.0f});
    gcite::Retriever retriever(corpus, emb);

    ScriptedGenerator gen("Families need housing [2]. Repairs lag [1].\n\n### Sources\n1. A\n2. B");
    auto ans = gcite::generate_grounded(retriever, gen, "housing need", std::nullopt, 5);
    assert(gen.calls() == 1);
    assert(gen.last().query == "housing need");
    assert(gen.last().context.rfind("[1] Title A (2025-01-01)\n", 0) == 0);
    assert(gen.last().context.find("[2] Title B ()") != std::string::npos);
    assert(gen.last().passages.size() == 3);

    assert(ans.passages.size() == 3);
    assert(ans.result.text == "Families need housing [1]. Repairs lag [2].");
    assert(ans.result.sources.size() == 2);
    assert(ans.result.sources[0].document_id == "B");
    assert(ans.result.sources[1].document_id == "A");

    // strict-empty retrieval: generator sees no context, markers are stripped
    gcite::RetrieveFilter f;
    f.topics = std::vector<std::string>{"nothing-matches"};
    ScriptedGenerator gen2("Unsupported claim [1].");
    auto empty = gcite::generate_grounded(retriever, gen2, "housing need", f, 5);
    assert(gen2.last().context == gcite::kNoContext);
    assert(empty.passages.empty());
    assert(empty.result.text == "Unsupported claim.");
    assert(empty.result.sources.empty());

    ScriptedGenerator gen3("Async [1].");
    auto fut = gcite::generate_grounded_async(retriever, gen3, "housing need", std::nullopt, 5);
    auto a = fut.get();
    assert(a.result.text == "Async [1].");
    assert(a.result.sources.size() == 1 && a.result.sources[0].document_id == "A");
}

int main() {
    test_ground_text_modes();
    test_generate_grounded();
    std::cout << "OK\n";
    return 0;
}
