#pragma once
#include <string>
#include "common/types.hpp"

namespace transit {

// Throws ConfigError when any field is out of range.
void ValidateRunConfig(const RunConfig& cfg);

// "callsign" / "callsign+icao24"
GroupingKey ParseGroupingKey(const std::string& text);
std::string ToString(GroupingKey key);

} // namespace transit
