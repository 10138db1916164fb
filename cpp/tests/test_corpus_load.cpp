#include <cassert>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "gcite/corpus.h"
#include "gcite/errors.h"
#include "gcite/manifest.h"
#include "test_util.h"

namespace fs = std::filesystem;

static gcite::ErrorCode load_error_code(const fs::path& dir) {
    try {
        gcite::load_corpus(dir);
    } catch (const gcite::CorpusLoadError& e) {
        return e.code();
    }
    return gcite::ErrorCode::Ok;
}

static fs::path small_fixture(const std::string& tag) {
    std::vector<gcite::PassageRecord> recs = {mk_rec("A", "a0"), mk_rec("A", "a1"), mk_rec("B", "b0")};
    std::vector<std::vector<float>> vecs = {unit_at(0.1), unit_at(0.5), unit_at(1.0)};
    return write_fixture(tag, recs, vecs);
}

static void test_load_ok() {
    auto dir = small_fixture("load_ok");
    auto c = gcite::load_corpus(dir);
    assert(c->size() == 3);
    assert(c->dim() == 3);
    assert(c->get(2).document_id == "B");
    assert(c->manifest().present);
    assert(c->manifest().embed_model == "test-model");

    bool threw = false;
    try {
        c->get(3);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    // a file path inside the directory resolves to the directory
    auto c2 = gcite::load_corpus(dir / "chunks.jsonl");
    assert(c2->size() == 3);
}

static void test_missing_files() {
    auto dir = small_fixture("missing");
    fs::remove(dir / "embeddings.npy");
    assert(load_error_code(dir) == gcite::ErrorCode::CorpusMissing);

    auto empty = mk_tmp_dir("missing_all");
    assert(load_error_code(empty) == gcite::ErrorCode::CorpusMissing);
}

static void test_count_mismatch() {
    auto dir = small_fixture("count");
    fs::remove(dir / "manifest.json");
    {
        std::ofstream out(dir / "chunks.jsonl", std::ios::app);
        out << R"({"doc_id":"C","chunk_id":"c0","text":"extra"})" << "\n";
    }
    assert(load_error_code(dir) == gcite::ErrorCode::InvalidFormat);
}

static void test_manifest_mismatch() {
    auto dir = small_fixture("manifest_dim");
    gcite::CorpusManifest m;
    std::string err;
    assert(gcite::load_manifest(dir, m, &err));
    m.dim = 7;
    assert(gcite::write_manifest(dir, m));
    assert(load_error_code(dir) == gcite::ErrorCode::InvalidFormat);

    auto dir2 = small_fixture("manifest_bad");
    {
        std::ofstream out(dir2 / "manifest.json", std::ios::trunc);
        out << "{ not json";
    }
    assert(load_error_code(dir2) == gcite::ErrorCode::InvalidFormat);
}

static void test_bad_records() {
    // duplicate passage ids
    std::vector<gcite::PassageRecord> recs = {mk_rec("A", "same"), mk_rec("B", "same")};
    auto dir = write_fixture("dup", recs, {unit_at(0.1), unit_at(0.2)});
    assert(load_error_code(dir) == gcite::ErrorCode::InvalidFormat);

    // vectors written without normalization
    auto dir2 = mk_tmp_dir("unnormalized");
    gcite::WriteOptions wo;
    wo.normalize = false;
    gcite::write_corpus(dir2, {mk_rec("A", "a0")}, {{3.0f, 4.0f, 0.0f}}, wo);
    assert(load_error_code(dir2) == gcite::ErrorCode::InvalidFormat);

    // malformed JSONL line
    auto dir3 = small_fixture("badjson");
    {
        std::ofstream out(dir3 / "chunks.jsonl", std::ios::trunc);
        out << R"({"doc_id":"A","chunk_id":"a0"})" << "\n" << "{oops\n" << R"({"chunk_id":"x"})" << "\n";
    }
    assert(load_error_code(dir3) == gcite::ErrorCode::ParseError);
}

static void test_legacy_aliases() {
    auto dir = mk_tmp_dir("legacy");
    std::vector<gcite::PassageRecord> placeholder(4);
    for (size_t i = 0; i < placeholder.size(); ++i) placeholder[i].passage_id = "p" + std::to_string(i);
    gcite::WriteOptions wo;
    wo.write_manifest = false;
    gcite::write_corpus(dir, placeholder, {unit_at(0.1), unit_at(0.2), unit_at(0.3), unit_at(0.4)}, wo);
    fs::copy_file(test_data_file("legacy_chunks.jsonl"), dir / "chunks.jsonl", fs::copy_options::overwrite_existing);

    auto c = gcite::load_corpus(dir);
    assert(c->size() == 4);

    const auto& r0 = c->get(0);
    assert(r0.document_id == "fema-2024-09");
    assert(r0.url == "https://www.fema.gov/helene");
    assert(r0.county == "Buncombe");
    assert(r0.topics.size() == 2 && r0.topics[1] == "Recovery");
    assert(r0.date && r0.date->to_string() == "2024-10-02");

    const auto& r1 = c->get(1);
    assert(r1.document_id == "ncdot-roads");
    assert(r1.passage_id == "ncdot-roads::row1");
    assert(r1.title == "NCDOT Road Status");
    assert(r1.url == "https://www.ncdot.gov/roads");
    assert(r1.topics.size() == 1 && r1.topics[0] == "roads");
    assert(r1.date && r1.date->to_string() == "2024-11-15");

    const auto& r2 = c->get(2);
    assert(r2.passage_id == "free-standing");
    assert(r2.document_id.empty());
    assert(r2.date_raw == "soon" && !r2.date);
    assert(r2.topics.empty());

    const auto& r3 = c->get(3);
    assert(r3.passage_id == "row3");
}

static void test_text_clip() {
    std::string big(100, 'x');
    big += "\xD0\x96"; // two-byte letter straddling the limit
    auto rec = mk_rec("A", "a0");
    rec.text = big;
    auto dir = write_fixture("clip", {rec}, {unit_at(0.0)});

    gcite::LoadOptions opt;
    opt.max_text_bytes = 101;
    auto c = gcite::load_corpus(dir, opt);
    assert(c->get(0).text.size() == 100);
}

static void test_cache() {
    auto d1 = small_fixture("cache1");
    auto d2 = small_fixture("cache2");

    gcite::CorpusCache cache;
    assert(!cache.current());

    auto h1 = cache.load(d1);
    auto h1b = cache.load(d1 / "." );
    assert(h1.get() == h1b.get());
    assert(cache.current().get() == h1.get());

    auto h2 = cache.load(d2);
    assert(h2.get() != h1.get());
    assert(cache.current().get() == h2.get());

    // failed load keeps the resident corpus
    auto bad = mk_tmp_dir("cache_bad");
    bool threw = false;
    try {
        cache.load(bad);
    } catch (const gcite::CorpusLoadError& e) {
        threw = true;
        assert(e.code() == gcite::ErrorCode::CorpusMissing);
    }
    assert(threw);
    assert(cache.current().get() == h2.get());

    // old handle stays usable after replacement
    assert(h1->size() == 3);

    // readers see the resident corpus while another thread loads
    auto d3 = small_fixture("cache3");
    auto a = std::async(std::launch::async, [&] { return cache.load(d3); });
    auto b = std::async(std::launch::async, [&] { return cache.load(d3); });
    for (int i = 0; i < 100; ++i) {
        auto cur = cache.current();
        assert(cur);
        assert(cur->size() == 3);
    }
    auto h3 = a.get();
    auto h3b = b.get();
    assert(h3.get() == h3b.get());
    assert(h3.get() != h2.get());
    assert(cache.current().get() == h3.get());
}

int main() {
    test_load_ok();
    test_missing_files();
    test_count_mismatch();
    test_manifest_mismatch();
    test_bad_records();
    test_legacy_aliases();
    test_text_clip();
    test_cache();
    std::cout << "OK\n";
    return 0;
}
