#pragma once
#include <stdexcept>
#include <string>

namespace transit {

// Latitude/longitude outside [-90,90] / [-180,180] or not finite.
// Per-flight: the flight is counted as failed, the run continues.
class InvalidCoordinate : public std::runtime_error {
public:
  explicit InvalidCoordinate(const std::string& what) : std::runtime_error(what) {}
};

// A required column is absent or a required cell cannot be parsed.
class MalformedField : public std::runtime_error {
public:
  MalformedField(const std::string& column, const std::string& value)
      : std::runtime_error("malformed field '" + column + "': '" + value + "'"),
        column_(column) {}

  const std::string& column() const { return column_; }

private:
  std::string column_;
};

// A source table could not be read. Costs that table only.
class SourceReadError : public std::runtime_error {
public:
  explicit SourceReadError(const std::string& what) : std::runtime_error(what) {}
};

// Run-level: nothing usable came out of the sources.
class EmptySourceError : public std::runtime_error {
public:
  explicit EmptySourceError(const std::string& what) : std::runtime_error(what) {}
};

// Run-level: configuration unreadable or out of range.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace transit
