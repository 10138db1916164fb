// gcite/cpp/include/gcite/passage.h
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gcite {

struct Date {
    int year{0};
    int month{0};
    int day{0};

    int ordinal() const { return year * 10000 + month * 100 + day; }
    std::string to_string() const; // YYYY-MM-DD
};

inline bool operator==(const Date& a, const Date& b) { return a.ordinal() == b.ordinal(); }
inline bool operator!=(const Date& a, const Date& b) { return !(a == b); }
inline bool operator<(const Date& a, const Date& b) { return a.ordinal() < b.ordinal(); }
inline bool operator<=(const Date& a, const Date& b) { return a.ordinal() <= b.ordinal(); }
inline bool operator>(const Date& a, const Date& b) { return b < a; }

// Accepts "YYYY-MM-DD", optionally followed by a time part ("T..." or " ...")
// which is ignored. Calendar validity is checked (leap years included).
std::optional<Date> parse_iso_date(std::string_view s);

struct PassageRecord {
    std::string document_id;   // owning source document, may be empty
    std::string passage_id;    // unique within corpus
    std::string title;
    std::string url;           // empty => none
    std::string date_raw;      // as ingested, may be unparseable
    std::optional<Date> date;  // parsed date_raw
    std::string county;        // empty => none
    std::vector<std::string> topics;
    std::string text;
};

} // namespace gcite
