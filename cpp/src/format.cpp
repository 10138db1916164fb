// gcite/cpp/src/format.cpp
#include "gcite/format.h"

#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace gcite {

namespace {

constexpr char kNpyMagic[6] = {'\x93', 'N', 'U', 'M', 'P', 'Y'};

static std::string dict_value(const std::string& hdr, const char* key) {
    const std::string k1 = std::string("'") + key + "'";
    size_t p = hdr.find(k1);
    if (p == std::string::npos) {
        const std::string k2 = std::string("\"") + key + "\"";
        p = hdr.find(k2);
        if (p == std::string::npos) return {};
        p += k2.size();
    } else {
        p += k1.size();
    }
    p = hdr.find(':', p);
    if (p == std::string::npos) return {};
    ++p;
    while (p < hdr.size() && hdr[p] == ' ') ++p;
    if (p >= hdr.size()) return {};

    if (hdr[p] == '(') {
        const size_t e = hdr.find(')', p);
        if (e == std::string::npos) return {};
        return hdr.substr(p, e - p + 1);
    }
    if (hdr[p] == '\'' || hdr[p] == '"') {
        const char q = hdr[p];
        const size_t e = hdr.find(q, p + 1);
        if (e == std::string::npos) return {};
        return hdr.substr(p + 1, e - p - 1);
    }
    size_t e = p;
    while (e < hdr.size() && hdr[e] != ',' && hdr[e] != '}') ++e;
    std::string v = hdr.substr(p, e - p);
    while (!v.empty() && v.back() == ' ') v.pop_back();
    return v;
}

static bool parse_shape(const std::string& s, std::vector<uint64_t>& dims) {
    dims.clear();
    if (s.size() < 2 || s.front() != '(' || s.back() != ')') return false;
    size_t i = 1;
    while (i + 1 < s.size()) {
        while (i + 1 < s.size() && (s[i] == ' ' || s[i] == ',')) ++i;
        if (i + 1 >= s.size()) break;
        if (s[i] < '0' || s[i] > '9') return false;
        uint64_t v = 0;
        while (i + 1 < s.size() && s[i] >= '0' && s[i] <= '9') {
            v = v * 10 + (uint64_t)(s[i] - '0');
            ++i;
        }
        dims.push_back(v);
    }
    return true;
}

} // namespace

bool read_npy_header(std::ifstream& in, NpyHeader& out, std::string* err) {
    char magic[6];
    in.read(magic, 6);
    if (!in || std::memcmp(magic, kNpyMagic, 6) != 0) {
        if (err) *err = "not a .npy file (bad magic)";
        return false;
    }

    unsigned char ver[2];
    in.read(reinterpret_cast<char*>(ver), 2);
    if (!in) {
        if (err) *err = "truncated .npy version";
        return false;
    }
    out.major = ver[0];
    out.minor = ver[1];

    uint32_t hlen = 0;
    if (out.major == 1) {
        unsigned char b[2];
        in.read(reinterpret_cast<char*>(b), 2);
        hlen = (uint32_t)b[0] | ((uint32_t)b[1] << 8);
    } else if (out.major == 2 || out.major == 3) {
        unsigned char b[4];
        in.read(reinterpret_cast<char*>(b), 4);
        hlen = (uint32_t)b[0] | ((uint32_t)b[1] << 8) | ((uint32_t)b[2] << 16) | ((uint32_t)b[3] << 24);
    } else {
        if (err) *err = "unsupported .npy version " + std::to_string(out.major);
        return false;
    }
    if (!in || hlen == 0 || hlen > (1u << 20)) {
        if (err) *err = "invalid .npy header length";
        return false;
    }

    std::string hdr(hlen, '\0');
    in.read(hdr.data(), (std::streamsize)hlen);
    if (!in) {
        if (err) *err = "truncated .npy header";
        return false;
    }

    const std::string descr = dict_value(hdr, "descr");
    if (descr.size() != 3 || (descr[0] != '<' && descr[0] != '|') || descr[1] != 'f' ||
        (descr[2] != '4' && descr[2] != '8')) {
        if (err) *err = "unsupported .npy dtype '" + descr + "' (expected <f4 or <f8)";
        return false;
    }
    out.dtype = 'f';
    out.word_size = (uint32_t)(descr[2] - '0');

    const std::string fo = dict_value(hdr, "fortran_order");
    if (fo == "True") {
        out.fortran_order = true;
    } else if (fo == "False") {
        out.fortran_order = false;
    } else {
        if (err) *err = "invalid .npy fortran_order";
        return false;
    }
    if (out.fortran_order) {
        if (err) *err = "fortran-ordered .npy arrays are not supported";
        return false;
    }

    std::vector<uint64_t> dims;
    if (!parse_shape(dict_value(hdr, "shape"), dims) || dims.size() != 2) {
        if (err) *err = "invalid .npy shape (expected 2-D matrix)";
        return false;
    }
    out.rows = dims[0];
    out.cols = dims[1];
    return true;
}

bool write_npy_header(std::ofstream& out, const NpyHeader& h) {
    std::ostringstream d;
    d << "{'descr': '<f" << h.word_size << "', 'fortran_order': False, 'shape': ("
      << h.rows << ", " << h.cols << "), }";
    std::string dict = d.str();

    // magic(6) + version(2) + len(2) + dict + '\n' must be a multiple of 64
    const size_t base = 10 + dict.size() + 1;
    const size_t pad = (64 - (base % 64)) % 64;
    dict.append(pad, ' ');
    dict.push_back('\n');

    out.write(kNpyMagic, 6);
    const unsigned char ver[2] = {1, 0};
    out.write(reinterpret_cast<const char*>(ver), 2);
    const uint16_t hlen = (uint16_t)dict.size();
    const unsigned char lb[2] = {(unsigned char)(hlen & 0xFF), (unsigned char)((hlen >> 8) & 0xFF)};
    out.write(reinterpret_cast<const char*>(lb), 2);
    out.write(dict.data(), (std::streamsize)dict.size());
    return (bool)out;
}

std::string utc_now_compact() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin) {
    try {
        std::error_code ec;
        std::filesystem::create_directories(fin.parent_path(), ec);

        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::filesystem::remove(fin, ec);
        ec.clear();
        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::cerr << "[gcite] atomic_replace failed: " << ec.message()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[gcite] atomic_replace exception: " << e.what()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    }
}

} // namespace gcite
