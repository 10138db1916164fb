// gcite/cpp/tools/gcite_validate_main.cpp
#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "gcite/config.h"
#include "gcite/validator.h"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: gcite_validate <kb_dir>\n";
        return 1;
    }

    const gcite::Config cfg = gcite::load_config_from_env();
    auto vr = gcite::validate_corpus(argv[1], cfg.load.norm_tolerance);

    nlohmann::json j;
    j["ok"] = vr.ok;
    j["errors"] = vr.errors;

    std::cout << j.dump() << "\n";
    return vr.ok ? 0 : 2;
}
