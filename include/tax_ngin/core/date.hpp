// include/tax_ngin/core/date.hpp

#pragma once

#include <functional>
#include <ostream>
#include <string>
#include "tax_ngin/core/error.hpp"

namespace tax_ngin {

/**
 * @brief Calendar date without a time-of-day component
 *
 * Trades are booked per calendar day, so the replay orders and groups
 * events by Date rather than by Timestamp.
 */
struct Date {
    int year{1970};
    int month{1};
    int day{1};

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Parse a date in any of the accepted ledger formats
     *
     * Tried in order: DD-Mon-YY, DD-Month-YY, DD Month YYYY, DD Mon YYYY,
     * DD-Mon-YYYY, DD-Month-YYYY, YYYY-MM-DD, DD/MM/YYYY, MM/DD/YYYY.
     * Two-digit years 00-68 are 20xx, 69-99 are 19xx.
     *
     * @param text Date text, e.g. "15-Jan-20"
     * @return Parsed date or CONVERSION_ERROR
     */
    static Result<Date> parse(const std::string& text);

    /**
     * @brief Check that month and day exist in the calendar
     */
    bool is_valid() const;

    /**
     * @brief Same month and day n years later
     * Feb 29 becomes Feb 28 when the target year is not a leap year
     */
    Date add_years(int years) const;

    /**
     * @brief Days since 1970-01-01 (proleptic Gregorian)
     */
    long days_since_epoch() const;

    /**
     * @brief Format as DD-Mon-YY, e.g. 15-Jan-20
     */
    std::string to_short_string() const;

    /**
     * @brief Format as YYYY-MM-DD
     */
    std::string to_iso_string() const;

    /**
     * @brief Year and month packed as YYYY-MM, used to group by month
     */
    std::string month_key() const;

    friend bool operator==(const Date& a, const Date& b) {
        return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    friend bool operator!=(const Date& a, const Date& b) {
        return !(a == b);
    }
    friend bool operator<(const Date& a, const Date& b) {
        if (a.year != b.year)
            return a.year < b.year;
        if (a.month != b.month)
            return a.month < b.month;
        return a.day < b.day;
    }
    friend bool operator<=(const Date& a, const Date& b) {
        return !(b < a);
    }
    friend bool operator>(const Date& a, const Date& b) {
        return b < a;
    }
    friend bool operator>=(const Date& a, const Date& b) {
        return !(a < b);
    }

    friend std::ostream& operator<<(std::ostream& os, const Date& d) {
        return os << d.to_iso_string();
    }
};

bool is_leap_year(int year);

int days_in_month(int year, int month);

}  // namespace tax_ngin

namespace std {
template <>
struct hash<tax_ngin::Date> {
    size_t operator()(const tax_ngin::Date& d) const {
        return std::hash<long>()(d.days_since_epoch());
    }
};
}  // namespace std
