/**
 * @file CalendarDate.hpp
 * @brief Value Object for a logical calendar day (no time, no zone).
 */

#pragma once

#include <string>
#include <optional>
#include <tuple>

namespace staffledger::domain {

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    CalendarDate() = default;
    CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Parses "YYYY-MM-DD". A trailing time part ("YYYY-MM-DDTHH:MM...")
     * is accepted and ignored so datetime strings compare on their date.
     * @return std::nullopt when the text is not a valid Gregorian date.
     */
    static std::optional<CalendarDate> Parse(const std::string& text);

    /** @brief Formats as ISO "YYYY-MM-DD". */
    std::string toString() const;

    bool operator==(const CalendarDate& other) const {
        return std::tie(year, month, day) == std::tie(other.year, other.month, other.day);
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const {
        return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
    }
    bool operator>(const CalendarDate& other) const { return other < *this; }
    bool operator<=(const CalendarDate& other) const { return !(other < *this); }
    bool operator>=(const CalendarDate& other) const { return !(*this < other); }
};

/**
 * @brief Inclusive range check. Either bound may be absent.
 */
inline bool InDateRange(const CalendarDate& date,
                        const std::optional<CalendarDate>& from,
                        const std::optional<CalendarDate>& to) {
    if (from && date < *from) return false;
    if (to && date > *to) return false;
    return true;
}

} // namespace staffledger::domain
