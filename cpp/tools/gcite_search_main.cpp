// gcite/cpp/tools/gcite_search_main.cpp
#include <iostream>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "gcite/config.h"
#include "gcite/errors.h"
#include "gcite/result.h"
#include "gcite/retriever.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

struct QueryLine {
    std::string query;
    std::vector<float> embedding;
    size_t line{0};
};

static bool read_queries(const std::filesystem::path& p, std::vector<QueryLine>& out, std::string* err) {
    std::ifstream in(p);
    if (!in) {
        if (err) *err = "cannot open " + p.string();
        return false;
    }
    std::string line;
    size_t ln = 0;
    while (std::getline(in, line)) {
        ++ln;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            const auto j = nlohmann::json::parse(line);
            QueryLine q;
            q.query = j.at("query").get<std::string>();
            q.embedding = j.at("embedding").get<std::vector<float>>();
            q.line = ln;
            out.push_back(std::move(q));
        } catch (const nlohmann::json::exception& e) {
            if (err) *err = p.string() + ":" + std::to_string(ln) + ": " + e.what();
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: gcite_search <kb_dir> --queries FILE [--k N] [--topic T]... [--county C]..."
                     " [--date-from YYYY-MM-DD] [--date-to YYYY-MM-DD]\n";
        return 1;
    }

    gcite::Config cfg = gcite::load_config_from_env();
    cfg.kb_path = argv[1];

    std::string queries_path;
    size_t k = cfg.retrieve.top_k;
    nlohmann::json fj = nlohmann::json::object();
    bool have_filter = false;

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--queries") queries_path = arg_value(i, argc, argv);
        else if (a == "--k") k = (size_t)std::stoul(arg_value(i, argc, argv));
        else if (a == "--topic") { fj["topics"].push_back(arg_value(i, argc, argv)); have_filter = true; }
        else if (a == "--county") { fj["counties"].push_back(arg_value(i, argc, argv)); have_filter = true; }
        else if (a == "--date-from") { fj["date_from"] = arg_value(i, argc, argv); have_filter = true; }
        else if (a == "--date-to") { fj["date_to"] = arg_value(i, argc, argv); have_filter = true; }
    }

    if (queries_path.empty()) {
        std::cerr << "Missing --queries\n";
        return 2;
    }

    std::string err;
    std::optional<gcite::RetrieveFilter> filter;
    if (have_filter) {
        gcite::RetrieveFilter f;
        if (!gcite::parse_filter_json(fj, f, &err)) {
            std::cerr << err << "\n";
            return 2;
        }
        filter = f;
    }

    std::vector<QueryLine> queries;
    if (!read_queries(queries_path, queries, &err)) {
        std::cerr << err << "\n";
        return 2;
    }

    gcite::StaticEmbeddingProvider embedder;
    for (const auto& q : queries) {
        if (!embedder.add(q.query, q.embedding)) {
            std::cerr << queries_path << ":" << q.line
                      << ": duplicate query text with a different embedding: " << q.query << "\n";
            return 2;
        }
    }

    try {
        gcite::CorpusCache cache;
        cache.load(cfg.kb_path, cfg.load);
        gcite::Retriever retriever(cache, embedder, cfg.retrieve);

        nlohmann::json out = nlohmann::json::array();
        for (const auto& q : queries) {
            nlohmann::json e;
            e["query"] = q.query;
            e["hits"] = gcite::to_json(retriever.retrieve(q.query, filter, k));
            out.push_back(std::move(e));
        }
        std::cout << out.dump() << "\n";
    } catch (const gcite::CorpusLoadError& e) {
        std::cerr << "[gcite] load failed (" << gcite::error_code_name(e.code()) << "): " << e.what() << "\n";
        return e.code() == gcite::ErrorCode::CorpusMissing ? 3 : 4;
    } catch (const gcite::GciteException& e) {
        std::cerr << "[gcite] " << gcite::error_code_name(e.code()) << ": " << e.what() << "\n";
        return 4;
    }
    return 0;
}
