#include "common/types.hpp"

#include <ostream>

namespace transit {

OutlierFilters OutlierFilters::Default() {
  OutlierFilters f;
  f.enabled = true;
  f.ranges["velocity"] = {100.0, 250.0};
  f.ranges["baroaltitude"] = {3000.0, 7000.0};
  f.ranges["vertrate"] = {-20.0, 5.0};
  f.ranges["transit_time"] = {600.0, 3000.0};
  return f;
}

int RawTable::ColumnIndex(const std::string& column) const {
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (columns[i] == column) return static_cast<int>(i);
  }
  return -1;
}

std::ostream& operator<<(std::ostream& os, const BatchStats& s) {
  os << "tables=" << s.tables
     << " flights=" << s.flights
     << " processed=" << s.processed
     << " skipped=" << s.skipped
     << " failed=" << s.failed;
  if (s.unreadable_tables > 0) os << " unreadable_tables=" << s.unreadable_tables;
  return os;
}

std::optional<double> TrainingSample::Get(const std::string& column) const {
  if (column == "lat") return lat_deg;
  if (column == "lon") return lon_deg;
  if (column == "velocity") return velocity;
  if (column == "heading") return heading;
  if (column == "vertrate") return vertrate;
  if (column == "baroaltitude") return baroaltitude;
  if (column == "geoaltitude") return geoaltitude;
  if (column == "hour") return static_cast<double>(hour_epoch_s);
  if (column == "arrival_time") return arrival_time_s;
  if (column == "transit_time") return transit_time_s;
  return std::nullopt;
}

const std::vector<std::string>& DatasetColumns() {
  static const std::vector<std::string> kColumns = {
      "callsign", "icao24", "lat", "lon", "velocity", "heading", "vertrate",
      "baroaltitude", "geoaltitude", "hour", "arrival_time", "transit_time"};
  return kColumns;
}

} // namespace transit
