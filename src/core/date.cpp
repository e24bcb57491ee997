// src/core/date.cpp

#include "tax_ngin/core/date.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <vector>

namespace tax_ngin {

namespace {

constexpr std::array<const char*, 12> kMonthAbbrev = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                      "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

constexpr std::array<const char*, 12> kMonthNames = {
    "january", "february", "march",     "april",   "may",      "june",
    "july",    "august",   "september", "october", "november", "december"};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

// Digits only, length within [min_len, max_len]
bool parse_number(const std::string& s, size_t min_len, size_t max_len, int& out) {
    if (s.size() < min_len || s.size() > max_len)
        return false;
    int value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

// Abbreviated or full month name, case-insensitive; 0 when unknown
int month_from_name(const std::string& name) {
    const std::string lower = to_lower(name);
    for (size_t i = 0; i < kMonthNames.size(); ++i) {
        const std::string full = kMonthNames[i];
        if (lower == full || lower == full.substr(0, 3)) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

int expand_two_digit_year(int yy) {
    return yy < 69 ? 2000 + yy : 1900 + yy;
}

// DD<sep>Month<sep>YY or DD<sep>Month<sep>YYYY
bool parse_named_month(const std::string& text, char sep, Date& out) {
    auto parts = split(text, sep);
    if (parts.size() != 3)
        return false;

    int day = 0;
    int year = 0;
    if (!parse_number(parts[0], 1, 2, day))
        return false;
    int month = month_from_name(parts[1]);
    if (month == 0)
        return false;

    if (parts[2].size() <= 2) {
        if (!parse_number(parts[2], 1, 2, year))
            return false;
        year = expand_two_digit_year(year);
    } else if (!parse_number(parts[2], 4, 4, year)) {
        return false;
    }

    Date candidate(year, month, day);
    if (!candidate.is_valid())
        return false;
    out = candidate;
    return true;
}

bool parse_iso(const std::string& text, Date& out) {
    auto parts = split(text, '-');
    if (parts.size() != 3)
        return false;
    Date candidate;
    if (!parse_number(parts[0], 4, 4, candidate.year) ||
        !parse_number(parts[1], 1, 2, candidate.month) ||
        !parse_number(parts[2], 1, 2, candidate.day))
        return false;
    if (!candidate.is_valid())
        return false;
    out = candidate;
    return true;
}

// DD/MM/YYYY, falling back to MM/DD/YYYY when the first reading is impossible
bool parse_slashed(const std::string& text, Date& out) {
    auto parts = split(text, '/');
    if (parts.size() != 3)
        return false;
    int first = 0;
    int second = 0;
    int year = 0;
    if (!parse_number(parts[0], 1, 2, first) || !parse_number(parts[1], 1, 2, second) ||
        !parse_number(parts[2], 4, 4, year))
        return false;

    Date day_first(year, second, first);
    if (day_first.is_valid()) {
        out = day_first;
        return true;
    }
    Date month_first(year, first, second);
    if (month_first.is_valid()) {
        out = month_first;
        return true;
    }
    return false;
}

}  // namespace

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year))
        return 29;
    return kDays[month - 1];
}

Result<Date> Date::parse(const std::string& raw_text) {
    const std::string text = trim(raw_text);
    if (text.empty()) {
        return make_error<Date>(ErrorCode::CONVERSION_ERROR, "Empty date value", "Date");
    }

    Date parsed;
    if (parse_named_month(text, '-', parsed) || parse_named_month(text, ' ', parsed) ||
        parse_iso(text, parsed) || parse_slashed(text, parsed)) {
        return parsed;
    }

    return make_error<Date>(ErrorCode::CONVERSION_ERROR,
                            "Unable to parse date: " + text +
                                ". Expected format: DD-MMM-YY (e.g., 01-Nov-01)",
                            "Date");
}

bool Date::is_valid() const {
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1)
        return false;
    return day <= days_in_month(year, month);
}

Date Date::add_years(int years) const {
    Date shifted(year + years, month, day);
    int last_day = days_in_month(shifted.year, shifted.month);
    if (shifted.day > last_day) {
        shifted.day = last_day;
    }
    return shifted;
}

long Date::days_since_epoch() const {
    // Civil-from-days inverse, proleptic Gregorian calendar
    const long y = static_cast<long>(year) - (month <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long m = month;
    const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string Date::to_short_string() const {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d-%s-%02d", day, kMonthAbbrev[month - 1],
                  year % 100);
    return std::string(buffer);
}

std::string Date::to_iso_string() const {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
}

std::string Date::month_key() const {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", year, month);
    return std::string(buffer);
}

}  // namespace tax_ngin
