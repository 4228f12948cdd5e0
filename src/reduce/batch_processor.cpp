#include "reduce/batch_processor.hpp"

#include <ostream>
#include <unordered_map>
#include <utility>

#include "common/errors.hpp"
#include "common/text_parse.hpp"

namespace transit {

namespace {

using text::Cell;

std::optional<double> OptionalNumber(const std::vector<std::string>& row, int idx) {
  if (idx < 0) return std::nullopt;
  return text::ParseNumber(Cell(row, idx));
}

double RequiredNumber(const std::vector<std::string>& row, int idx, const char* column) {
  const auto v = text::ParseNumber(Cell(row, idx));
  if (!v) throw MalformedField(column, Cell(row, idx));
  return *v;
}

int RequireColumn(const RawTable& table, const char* name) {
  const int idx = table.ColumnIndex(name);
  if (idx < 0) throw MalformedField(name, "<missing column>");
  return idx;
}

std::string GroupKey(const std::vector<std::string>& row, const TelemetryColumns& cols, GroupingKey group_by) {
  std::string key = text::Trim(Cell(row, cols.callsign));
  if (key.empty()) return key;
  if (group_by == GroupingKey::kCallsignIcao24) {
    key += '|';
    key += text::Trim(Cell(row, cols.icao24));
  }
  return key;
}

} // namespace

TelemetryColumns TelemetryColumns::Resolve(const RawTable& table) {
  TelemetryColumns c;
  c.callsign = RequireColumn(table, "callsign");
  c.icao24 = RequireColumn(table, "icao24");
  c.time = RequireColumn(table, "time");
  c.lat = RequireColumn(table, "lat");
  c.lon = RequireColumn(table, "lon");
  c.baroaltitude = RequireColumn(table, "baroaltitude");

  c.velocity = table.ColumnIndex("velocity");
  c.heading = table.ColumnIndex("heading");
  c.vertrate = table.ColumnIndex("vertrate");
  c.geoaltitude = table.ColumnIndex("geoaltitude");
  c.hour = table.ColumnIndex("hour");
  return c;
}

TrajectoryBatchProcessor::TrajectoryBatchProcessor(ReferencePoint reference, DistanceBand band,
                                                   GroupingKey group_by, std::ostream* log)
    : reducer_(reference, band), group_by_(group_by), log_(log) {}

std::vector<RowGroup> TrajectoryBatchProcessor::GroupRows(const RawTable& table, const TelemetryColumns& cols,
                                                          GroupingKey group_by, std::size_t* keyless_rows) {
  std::vector<RowGroup> groups;
  std::unordered_map<std::string, std::size_t> slot; // key -> index in groups
  std::size_t keyless = 0;

  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    std::string key = GroupKey(table.rows[r], cols, group_by);
    if (key.empty()) {
      ++keyless;
      continue;
    }
    auto it = slot.find(key);
    if (it == slot.end()) {
      it = slot.emplace(key, groups.size()).first;
      groups.push_back(RowGroup{std::move(key), {}});
    }
    groups[it->second].rows.push_back(r);
  }

  if (keyless_rows) *keyless_rows = keyless;
  return groups;
}

TelemetryPoint TrajectoryBatchProcessor::ParseRow(const std::vector<std::string>& row, const TelemetryColumns& cols) {
  TelemetryPoint p;
  p.callsign = text::Trim(Cell(row, cols.callsign));
  p.icao24 = text::Trim(Cell(row, cols.icao24));

  const auto t = text::ParseInstant(Cell(row, cols.time));
  if (!t) throw MalformedField("time", Cell(row, cols.time));
  p.time_s = *t;

  p.lat_deg = RequiredNumber(row, cols.lat, "lat");
  p.lon_deg = RequiredNumber(row, cols.lon, "lon");

  p.velocity = OptionalNumber(row, cols.velocity);
  p.heading = OptionalNumber(row, cols.heading);
  p.vertrate = OptionalNumber(row, cols.vertrate);
  p.baroaltitude = OptionalNumber(row, cols.baroaltitude);
  p.geoaltitude = OptionalNumber(row, cols.geoaltitude);
  p.hour = text::Trim(Cell(row, cols.hour));
  return p;
}

std::size_t TrajectoryBatchProcessor::CountUnusableFlights(const RawTable& table, GroupingKey group_by,
                                                          std::size_t* flights) {
  TelemetryColumns keys;
  keys.callsign = table.ColumnIndex("callsign");
  keys.icao24 = table.ColumnIndex("icao24");
  if (keys.callsign < 0) {
    // nothing to group on: every row is a failure of its own
    if (flights) *flights = 0;
    return table.rows.size();
  }
  std::size_t keyless = 0;
  const auto groups = GroupRows(table, keys, group_by, &keyless);
  if (flights) *flights = groups.size();
  return groups.size() + keyless;
}

Flight TrajectoryBatchProcessor::BuildFlight(const RawTable& table, const TelemetryColumns& cols,
                                             const RowGroup& group) {
  Flight f;
  f.key = group.key;
  f.points.reserve(group.rows.size());
  for (std::size_t r : group.rows) {
    f.points.push_back(ParseRow(table.rows[r], cols));
  }
  return f;
}

BatchStats TrajectoryBatchProcessor::ProcessTable(const RawTable& table, std::vector<LabeledRecord>& out) const {
  BatchStats stats;
  stats.tables = 1;

  TelemetryColumns cols;
  try {
    cols = TelemetryColumns::Resolve(table);
  } catch (const MalformedField& e) {
    stats.unreadable_tables = 1;
    stats.failed = CountUnusableFlights(table, group_by_, &stats.flights);
    if (log_) {
      *log_ << "[table " << table.name << "] unusable: " << e.what() << "\n";
      *log_ << "[table " << table.name << "] " << stats << "\n";
    }
    return stats;
  }

  std::size_t keyless = 0;
  const auto groups = GroupRows(table, cols, group_by_, &keyless);
  if (keyless > 0) {
    // every row without a callsign is a row-level failure of its own
    stats.failed += keyless;
    if (log_) *log_ << "[fail] " << table.name << ": " << keyless << " row(s) without callsign\n";
  }

  for (const auto& g : groups) {
    ++stats.flights;
    try {
      ReduceResult r = reducer_.Reduce(BuildFlight(table, cols, g));
      if (r.skipped()) {
        ++stats.skipped;
      } else {
        out.push_back(std::move(*r.record));
        ++stats.processed;
      }
    } catch (const InvalidCoordinate& e) {
      ++stats.failed;
      if (log_) *log_ << "[fail] " << g.key << ": " << e.what() << "\n";
    } catch (const MalformedField& e) {
      ++stats.failed;
      if (log_) *log_ << "[fail] " << g.key << ": " << e.what() << "\n";
    }
  }

  if (log_) *log_ << "[table " << table.name << "] " << stats << "\n";
  return stats;
}

BatchOutput TrajectoryBatchProcessor::Process(const std::vector<RawTable>& tables) const {
  BatchOutput out;
  for (const auto& t : tables) {
    out.stats += ProcessTable(t, out.records);
  }
  return out;
}

} // namespace transit
