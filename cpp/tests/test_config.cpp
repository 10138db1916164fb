#include <cassert>
#include <cstdlib>
#include <iostream>

#include "gcite/config.h"

int main() {
    ::unsetenv("GCITE_KB_PATH");
    ::unsetenv("GCITE_TOP_K");
    ::unsetenv("GCITE_FLAT_INDEX");
    ::unsetenv("GCITE_FLAT_INDEX_THREADS");
    ::unsetenv("GCITE_NORM_TOLERANCE");
    ::unsetenv("GCITE_MAX_TEXT_BYTES");

    auto d = gcite::load_config_from_env();
    assert(d.kb_path == "data/processed");
    assert(d.retrieve.top_k == 8);
    assert(d.retrieve.use_flat_index);
    assert(d.load.build_flat_index);
    assert(d.load.flat_index_threads == 0);
    assert(d.load.max_text_bytes == 65536);

    ::setenv("GCITE_KB_PATH", "/srv/kb", 1);
    ::setenv("GCITE_TOP_K", "12", 1);
    ::setenv("GCITE_FLAT_INDEX", "false", 1);
    ::setenv("GCITE_FLAT_INDEX_THREADS", "3", 1);
    ::setenv("GCITE_NORM_TOLERANCE", "0.01", 1);
    ::setenv("GCITE_MAX_TEXT_BYTES", "not-a-number", 1);

    auto c = gcite::load_config_from_env();
    assert(c.kb_path == "/srv/kb");
    assert(c.retrieve.top_k == 12);
    assert(!c.retrieve.use_flat_index);
    assert(!c.load.build_flat_index);
    assert(c.load.flat_index_threads == 3);
    assert(c.load.norm_tolerance > 0.0099f && c.load.norm_tolerance < 0.0101f);
    assert(c.load.max_text_bytes == 65536);

    std::cout << "OK\n";
    return 0;
}
