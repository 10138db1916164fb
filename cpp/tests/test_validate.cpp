#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "gcite/validator.h"
#include "test_util.h"

static bool has_error(const gcite::ValidationResult& vr, const std::string& needle) {
    for (const auto& e : vr.errors) {
        if (e.find(needle) != std::string::npos) return true;
    }
    return false;
}

int main() {
    std::vector<gcite::PassageRecord> recs = {mk_rec("A", "a0", "2025-01-01"), mk_rec("B", "b0")};
    auto good = write_fixture("validate_ok", recs, {unit_at(0.1), unit_at(0.2)});

    auto vr = gcite::validate_corpus(good);
    if (!vr.ok) {
        for (auto& e : vr.errors) std::cerr << e << "\n";
    }
    assert(vr.ok);

    // several problems at once are all reported
    auto bad = mk_tmp_dir("validate_bad");
    std::vector<gcite::PassageRecord> bad_recs = {mk_rec("A", "dup", "2025-13-01"), mk_rec("B", "dup")};
    gcite::WriteOptions wo;
    wo.normalize = false;
    gcite::write_corpus(bad, bad_recs, {{2.0f, 0.0f}, {0.6f, 0.8f}}, wo);
    {
        std::ofstream out(bad / "chunks.jsonl", std::ios::app);
        out << R"({"doc_id":"C","chunk_id":"c0"})" << "\n";
    }

    auto br = gcite::validate_corpus(bad);
    assert(!br.ok);
    assert(has_error(br, "duplicate passage ids"));
    assert(has_error(br, "unparseable dates"));
    assert(has_error(br, "not unit-normalized"));
    assert(has_error(br, "count mismatch"));

    auto missing = mk_tmp_dir("validate_missing");
    auto mr = gcite::validate_corpus(missing);
    assert(!mr.ok);
    assert(has_error(mr, "missing chunks.jsonl"));
    assert(has_error(mr, "missing embeddings.npy"));

    std::cout << "OK\n";
    return 0;
}
