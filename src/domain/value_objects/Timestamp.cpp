/**
 * @file Timestamp.cpp
 * @brief Implementation of timestamp helpers.
 */

#include "domain/value_objects/Timestamp.hpp"
#include <cstdio>
#include <ctime>

namespace staffledger::domain {

namespace {

using Micros = std::chrono::microseconds;

struct Broken {
    std::tm tm{};
    long long micros = 0;
};

Broken Split(Timestamp ts) {
    auto sinceEpoch = std::chrono::duration_cast<Micros>(ts.time_since_epoch()).count();
    long long seconds = sinceEpoch / 1000000;
    long long micros = sinceEpoch % 1000000;
    if (micros < 0) {
        micros += 1000000;
        --seconds;
    }
    Broken out;
    std::time_t t = static_cast<std::time_t>(seconds);
    gmtime_r(&t, &out.tm);
    out.micros = micros;
    return out;
}

} // namespace

Timestamp Now() {
    return std::chrono::time_point_cast<Micros>(std::chrono::system_clock::now());
}

std::string FormatTimestamp(Timestamp ts) {
    Broken b = Split(ts);
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  b.tm.tm_year + 1900, b.tm.tm_mon + 1, b.tm.tm_mday,
                  b.tm.tm_hour, b.tm.tm_min, b.tm.tm_sec, b.micros);
    return buffer;
}

std::string FormatTimestampCompact(Timestamp ts) {
    Broken b = Split(ts);
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d%02d%02dT%02d%02d%02d.%06lld",
                  b.tm.tm_year + 1900, b.tm.tm_mon + 1, b.tm.tm_mday,
                  b.tm.tm_hour, b.tm.tm_min, b.tm.tm_sec, b.micros);
    return buffer;
}

std::optional<Timestamp> ParseTimestamp(const std::string& text) {
    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }

    long long micros = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
    }
    if (pos < text.size() && text[pos] == 'Z') ++pos;
    if (pos != text.size()) return std::nullopt;

    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    std::time_t seconds = timegm(&tm);
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(seconds) + Micros(micros)));
}

} // namespace staffledger::domain
