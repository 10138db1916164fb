// gcite/cpp/include/gcite/config.h
#pragma once
#include <filesystem>

#include "gcite/corpus.h"
#include "gcite/retriever.h"

namespace gcite {

struct Config {
    std::filesystem::path kb_path{"data/processed"};
    LoadOptions load;
    RetrieveOptions retrieve;
};

// GCITE_KB_PATH, GCITE_TOP_K, GCITE_FLAT_INDEX, GCITE_FLAT_INDEX_THREADS,
// GCITE_NORM_TOLERANCE, GCITE_MAX_TEXT_BYTES. Unset or unparseable values keep
// the defaults.
Config load_config_from_env();

} // namespace gcite
