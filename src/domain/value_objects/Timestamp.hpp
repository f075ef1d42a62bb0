/**
 * @file Timestamp.hpp
 * @brief Wall-clock instants as stored on records (UTC, microsecond precision).
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace staffledger::domain {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Current time truncated to microseconds, so a value survives a
 * format/parse cycle unchanged.
 */
Timestamp Now();

/** @brief Formats as "YYYY-MM-DDTHH:MM:SS.ffffffZ". */
std::string FormatTimestamp(Timestamp ts);

/**
 * @brief Parses the output of FormatTimestamp. The fractional part and the
 * trailing 'Z' are optional; a value without zone is read as UTC.
 */
std::optional<Timestamp> ParseTimestamp(const std::string& text);

/** @brief Compact form used in file names: "YYYYMMDDTHHMMSS.ffffff". */
std::string FormatTimestampCompact(Timestamp ts);

} // namespace staffledger::domain
