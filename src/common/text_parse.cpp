#include "common/text_parse.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace transit::text {

namespace {

// 18 decimal digits always fit in int64.
constexpr std::size_t kMaxDigits = 18;

bool IsLeap(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(std::int64_t y, unsigned m) {
  static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && IsLeap(y)) return 29;
  return kDays[m - 1];
}

// Minimal forward-only cursor over a string.
struct Cursor {
  const std::string& s;
  std::size_t pos{0};

  bool Done() const { return pos >= s.size(); }
  char Peek() const { return Done() ? '\0' : s[pos]; }

  bool Accept(char c) {
    if (Peek() == c) {
      ++pos;
      return true;
    }
    return false;
  }

  void SkipSpaces() {
    while (!Done() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
  }

  // Exactly `n` digits when n > 0, otherwise one to kMaxDigits.
  bool Digits(int n, std::int64_t& out) {
    std::size_t start = pos;
    std::int64_t v = 0;
    while (!Done() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      if (n > 0 && static_cast<int>(pos - start) == n) break;
      if (n == 0 && pos - start == kMaxDigits) {
        pos = start;
        return false;
      }
      v = v * 10 + (s[pos] - '0');
      ++pos;
    }
    const std::size_t len = pos - start;
    if (len == 0 || (n > 0 && static_cast<int>(len) != n)) {
      pos = start;
      return false;
    }
    out = v;
    return true;
  }

  // ".fff" -> 0.fff
  double Fraction() {
    if (Peek() != '.') return 0.0;
    ++pos;
    double scale = 0.1;
    double v = 0.0;
    while (!Done() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      v += (s[pos] - '0') * scale;
      scale *= 0.1;
      ++pos;
    }
    return v;
  }
};

// HH:MM:SS[.fff] -> seconds (hours unbounded, as in "25:00:00").
std::optional<double> ParseClock(Cursor& c, bool bounded_hours) {
  std::int64_t hh = 0, mm = 0, ss = 0;
  if (!c.Digits(0, hh)) return std::nullopt;
  if (!c.Accept(':')) return std::nullopt;
  if (!c.Digits(2, mm) || mm > 59) return std::nullopt;
  double frac = 0.0;
  if (c.Accept(':')) {
    if (!c.Digits(2, ss) || ss > 60) return std::nullopt;
    frac = c.Fraction();
  }
  if (bounded_hours && hh > 23) return std::nullopt;
  return static_cast<double>(hh) * 3600.0 + static_cast<double>(mm * 60 + ss) + frac;
}

} // namespace

const std::string& Cell(const std::vector<std::string>& row, int idx) {
  static const std::string kEmpty;
  if (idx < 0 || static_cast<std::size_t>(idx) >= row.size()) return kEmpty;
  return row[static_cast<std::size_t>(idx)];
}

std::string Trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::optional<double> ParseNumber(const std::string& s) {
  const std::string t = Trim(s);
  if (t.empty()) return std::nullopt;

  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(t.c_str(), &end);
  if (end != t.c_str() + t.size() || errno == ERANGE) return std::nullopt;
  if (!std::isfinite(v)) return std::nullopt;
  return v;
}

std::optional<std::int64_t> FloorToInt64(double v) {
  if (!std::isfinite(v)) return std::nullopt;
  const double f = std::floor(v);
  // [-2^63, 2^63)
  if (f < -9223372036854775808.0 || f >= 9223372036854775808.0) return std::nullopt;
  return static_cast<std::int64_t>(f);
}

std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const std::int64_t yoe = y - era * 400;
  const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

void CivilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  d = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
  m = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
  y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}

std::optional<double> ParseTimestamp(const std::string& s) {
  const std::string t = Trim(s);
  Cursor c{t};

  std::int64_t year = 0, month = 0, day = 0;
  if (!c.Digits(4, year) || !c.Accept('-')) return std::nullopt;
  if (!c.Digits(2, month) || !c.Accept('-')) return std::nullopt;
  if (!c.Digits(2, day)) return std::nullopt;
  if (month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > static_cast<std::int64_t>(DaysInMonth(year, static_cast<unsigned>(month)))) {
    return std::nullopt;
  }

  double secs_of_day = 0.0;
  if (!c.Done()) {
    if (!c.Accept('T') && !c.Accept(' ')) return std::nullopt;
    const auto clock = ParseClock(c, true);
    if (!clock) return std::nullopt;
    secs_of_day = *clock;
  }

  // Timezone designator: parsed for validity, then ignored.
  c.SkipSpaces();
  if (c.Accept('Z')) {
    // UTC
  } else if (c.Peek() == '+' || c.Peek() == '-') {
    ++c.pos;
    std::int64_t oh = 0, om = 0;
    if (!c.Digits(2, oh)) return std::nullopt;
    if (c.Accept(':')) {
      if (!c.Digits(2, om)) return std::nullopt;
    } else if (!c.Digits(2, om)) {
      om = 0; // "+01"
    }
    if (oh > 23 || om > 59) return std::nullopt;
  } else if (t.compare(c.pos, std::string::npos, "UTC") == 0) {
    c.pos = t.size();
  }
  if (!c.Done()) return std::nullopt;

  const std::int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  return static_cast<double>(days) * 86400.0 + secs_of_day;
}

std::optional<double> ParseInstant(const std::string& s) {
  if (auto v = ParseNumber(s)) return v;
  return ParseTimestamp(s);
}

std::optional<double> ParseDuration(const std::string& s) {
  if (auto v = ParseNumber(s)) return v;

  const std::string t = Trim(s);
  if (t.empty()) return std::nullopt;
  Cursor c{t};

  double total = 0.0;
  bool have_days = false;

  // "[-]N day(s)"
  {
    const std::size_t save = c.pos;
    const bool neg = c.Accept('-');
    if (!neg) c.Accept('+');
    std::int64_t n = 0;
    if (c.Digits(0, n)) {
      c.SkipSpaces();
      if (t.compare(c.pos, 3, "day") == 0) {
        c.pos += 3;
        c.Accept('s');
        total += (neg ? -1.0 : 1.0) * static_cast<double>(n) * 86400.0;
        have_days = true;
        c.SkipSpaces();
        c.Accept(',');
        c.SkipSpaces();
      } else {
        c.pos = save;
      }
    } else {
      c.pos = save;
    }
  }

  if (c.Done()) {
    if (have_days) return total;
    return std::nullopt;
  }

  double sign = 1.0;
  if (c.Accept('-')) {
    sign = -1.0;
  } else {
    c.Accept('+');
  }
  const auto clock = ParseClock(c, false);
  if (!clock || !c.Done()) return std::nullopt;
  return total + sign * *clock;
}

std::string FormatTimestamp(double epoch_s) {
  const auto floored = FloorToInt64(epoch_s);
  if (!floored) return {};
  std::int64_t whole = *floored;
  long long micros = std::llround((epoch_s - std::floor(epoch_s)) * 1e6);
  if (micros >= 1000000) {
    micros = 0;
    ++whole;
  }

  std::int64_t days = whole / 86400;
  std::int64_t rem = whole % 86400;
  if (rem < 0) {
    rem += 86400;
    days -= 1;
  }
  std::int64_t y = 0;
  unsigned m = 0, d = 0;
  CivilFromDays(days, y, m, d);

  char buf[80];
  int len = std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld:%02lld",
                          static_cast<long long>(y), m, d,
                          static_cast<long long>(rem / 3600),
                          static_cast<long long>((rem % 3600) / 60),
                          static_cast<long long>(rem % 60));
  if (micros > 0 && len > 0 && static_cast<std::size_t>(len) < sizeof(buf)) {
    std::snprintf(buf + len, sizeof(buf) - static_cast<std::size_t>(len), ".%06lld", micros);
  }
  return buf;
}

} // namespace transit::text
