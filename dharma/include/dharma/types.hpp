#pragma once
// Core types for the turn control plane
//
// Timestamps, text helpers shared by the guard and the orchestrator:
// - UTF-8 aware character counting and truncation
// - ASCII trimming and lowercasing
// - RFC3339 parsing and formatting

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace dharma {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;
    return s.substr(start, end - start);
}

inline std::string trim_start(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    return s.substr(start);
}

inline std::string to_lower(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Number of code points in a UTF-8 string (continuation bytes not counted)
inline size_t char_count(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

// Byte offset of the code point at index max_chars (s.size() if shorter)
inline size_t char_boundary(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == max_chars) return i;
            ++chars;
        }
    }
    return s.size();
}

// Keep at most max_chars code points, appending "..." when cut
inline std::string truncate_with_ellipsis(const std::string& s, size_t max_chars) {
    size_t end = char_boundary(s, max_chars);
    if (end >= s.size()) return s;
    std::string out = s.substr(0, end);
    while (!out.empty() && is_space(out.back())) out.pop_back();
    return out + "...";
}

namespace detail {

inline bool read_digits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return days[m - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date
inline int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

} // namespace detail

// Parse "YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)".
// Returns false on any syntax or range error; out receives Unix millis.
inline bool parse_rfc3339(const std::string& s, Timestamp* out = nullptr) {
    int year, month, day, hour, minute, second;
    if (!detail::read_digits(s, 0, 4, year)) return false;
    if (s.size() < 20 || s[4] != '-' || s[7] != '-') return false;
    if (!detail::read_digits(s, 5, 2, month) || !detail::read_digits(s, 8, 2, day)) return false;
    char sep = s[10];
    if (sep != 'T' && sep != 't' && sep != ' ') return false;
    if (!detail::read_digits(s, 11, 2, hour) || s[13] != ':') return false;
    if (!detail::read_digits(s, 14, 2, minute) || s[16] != ':') return false;
    if (!detail::read_digits(s, 17, 2, second)) return false;

    if (month < 1 || month > 12) return false;
    if (day < 1 || day > detail::days_in_month(year, month)) return false;
    if (hour > 23 || minute > 59 || second > 60) return false;

    size_t pos = 19;
    int millis = 0;
    if (s[pos] == '.') {
        ++pos;
        size_t frac_start = pos;
        int scale = 100;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            millis += (s[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == frac_start) return false;
    }
    if (pos >= s.size()) return false;

    int offset_minutes = 0;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        int oh, om;
        if (!detail::read_digits(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':')
            return false;
        if (!detail::read_digits(s, pos + 4, 2, om)) return false;
        if (oh > 23 || om > 59) return false;
        offset_minutes = oh * 60 + om;
        if (s[pos] == '-') offset_minutes = -offset_minutes;
        pos += 6;
    } else {
        return false;
    }
    if (pos != s.size()) return false;

    if (out) {
        int64_t days = detail::days_from_civil(year, month, day);
        int64_t secs = days * 86400 + hour * 3600 + minute * 60 + std::min(second, 59)
                     - static_cast<int64_t>(offset_minutes) * 60;
        *out = secs * 1000 + millis;
    }
    return true;
}

// Format as "YYYY-MM-DDTHH:MM:SSZ" (UTC, second precision)
inline std::string format_rfc3339(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

} // namespace dharma
