// gcite/cpp/src/config.cpp
#include "gcite/config.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace gcite {

static bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

static unsigned long long env_uint(const char* key, unsigned long long defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || s[0] == '-') {
        std::cerr << "[gcite] ignoring bad " << key << "=" << s << "\n";
        return defv;
    }
    return v;
}

static float env_float(const char* key, float defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    char* end = nullptr;
    errno = 0;
    const float v = std::strtof(s, &end);
    if (errno != 0 || end == s || *end != '\0' || !(v >= 0.0f)) {
        std::cerr << "[gcite] ignoring bad " << key << "=" << s << "\n";
        return defv;
    }
    return v;
}

Config load_config_from_env() {
    Config c;
    if (const char* p = std::getenv("GCITE_KB_PATH"); p && *p) c.kb_path = p;

    c.retrieve.top_k = (size_t)env_uint("GCITE_TOP_K", c.retrieve.top_k);
    c.retrieve.use_flat_index = env_bool("GCITE_FLAT_INDEX", c.retrieve.use_flat_index);

    c.load.build_flat_index = c.retrieve.use_flat_index;
    c.load.flat_index_threads = (unsigned)env_uint("GCITE_FLAT_INDEX_THREADS", c.load.flat_index_threads);
    c.load.norm_tolerance = env_float("GCITE_NORM_TOLERANCE", c.load.norm_tolerance);
    c.load.max_text_bytes = (size_t)env_uint("GCITE_MAX_TEXT_BYTES", c.load.max_text_bytes);
    return c;
}

} // namespace gcite
