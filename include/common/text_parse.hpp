#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace transit::text {

// Best-effort conversions used on raw cells. Anything that does not parse
// cleanly comes back as std::nullopt; callers decide whether that is fatal.

// row[idx], or an empty string when the column is absent (idx < 0) or the
// row is short.
const std::string& Cell(const std::vector<std::string>& row, int idx);

std::string Trim(const std::string& s);

// Finite decimal number. Empty, "nan", "inf" and trailing garbage -> nullopt.
std::optional<double> ParseNumber(const std::string& s);

// "YYYY-MM-DD[ T]HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM|+HHMM]" or a bare date.
// The offset is dropped and the wall clock is read as UTC.
// Returns epoch seconds (fractional part kept).
std::optional<double> ParseTimestamp(const std::string& s);

// Epoch seconds as a number, or anything ParseTimestamp accepts.
std::optional<double> ParseInstant(const std::string& s);

// Seconds as a number, "[-]HH:MM:SS[.fff]", or "N days [+|-]HH:MM:SS[.fff]"
// (the way pandas prints a Timedelta, e.g. "-1 days +23:36:40").
std::optional<double> ParseDuration(const std::string& s);

// floor(v) as int64; nullopt when not finite or outside the int64 range.
std::optional<std::int64_t> FloorToInt64(double v);

// Epoch seconds -> "YYYY-MM-DD HH:MM:SS[.ffffff]" (UTC, microseconds only
// when non-zero). Empty string when the value has no int64 second.
std::string FormatTimestamp(double epoch_s);

// Proleptic Gregorian calendar helpers.
std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d);
void CivilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d);

} // namespace transit::text
