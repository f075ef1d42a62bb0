/**
 * @file CalendarDate.cpp
 * @brief Implementation of CalendarDate.
 */

#include "domain/value_objects/CalendarDate.hpp"
#include <cctype>
#include <cstdio>

namespace staffledger::domain {

namespace {

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) return 29;
    return kDays[month - 1];
}

} // namespace

std::optional<CalendarDate> CalendarDate::Parse(const std::string& text) {
    if (text.size() < 10) return std::nullopt;
    for (size_t i = 0; i < 10; ++i) {
        if (i == 4 || i == 7) {
            if (text[i] != '-') return std::nullopt;
        } else if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') return std::nullopt;

    CalendarDate date;
    date.year = std::stoi(text.substr(0, 4));
    date.month = std::stoi(text.substr(5, 2));
    date.day = std::stoi(text.substr(8, 2));

    if (date.month < 1 || date.month > 12) return std::nullopt;
    if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) return std::nullopt;
    return date;
}

std::string CalendarDate::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

} // namespace staffledger::domain
