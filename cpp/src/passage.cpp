// gcite/cpp/src/passage.cpp
#include "gcite/passage.h"

#include <cstdio>

namespace gcite {

static bool read_digits(std::string_view s, size_t pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        const char c = s[i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

static int days_in_month(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2) {
        const bool leap = (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
        return leap ? 29 : 28;
    }
    return kDays[m - 1];
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::optional<Date> parse_iso_date(std::string_view s) {
    // YYYY-MM-DD
    if (s.size() < 10) return std::nullopt;
    if (s[4] != '-' || s[7] != '-') return std::nullopt;

    Date d;
    if (!read_digits(s, 0, 4, d.year)) return std::nullopt;
    if (!read_digits(s, 5, 2, d.month)) return std::nullopt;
    if (!read_digits(s, 8, 2, d.day)) return std::nullopt;

    if (d.year < 1 || d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;

    if (s.size() > 10) {
        // time part: "THH:MM[:SS...]" or " HH:MM..."
        const char sep = s[10];
        if (sep != 'T' && sep != ' ') return std::nullopt;
        int hh = 0, mm = 0;
        if (!read_digits(s, 11, 2, hh) || s.size() < 16 || s[13] != ':' || !read_digits(s, 14, 2, mm)) {
            return std::nullopt;
        }
        if (hh > 23 || mm > 59) return std::nullopt;
    }
    return d;
}

} // namespace gcite
