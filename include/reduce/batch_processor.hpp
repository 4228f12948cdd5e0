#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "reduce/flight_reducer.hpp"

namespace transit {

// Column positions of one raw table. Optional columns are -1 when absent.
struct TelemetryColumns {
  int callsign{-1};
  int icao24{-1};
  int time{-1};
  int lat{-1};
  int lon{-1};
  int baroaltitude{-1};
  // optional
  int velocity{-1};
  int heading{-1};
  int vertrate{-1};
  int geoaltitude{-1};
  int hour{-1};

  // Throws MalformedField naming the first required column that is missing.
  static TelemetryColumns Resolve(const RawTable& table);
};

// Row indices of one flight, in original row order.
struct RowGroup {
  std::string key;
  std::vector<std::size_t> rows;
};

struct BatchOutput {
  std::vector<LabeledRecord> records;
  BatchStats stats;
};

// ======================
// Raw tables -> labeled records
//
// Groups each table's rows into flights, reduces every flight, and keeps
// going when a flight is bad: InvalidCoordinate / MalformedField only cost
// that one flight (counted as failed). Skips are counted separately.
//
// Progress goes to `log` (one line per table); nothing else leaves the object.
// ======================
class TrajectoryBatchProcessor {
public:
  TrajectoryBatchProcessor(ReferencePoint reference, DistanceBand band,
                           GroupingKey group_by = GroupingKey::kCallsign,
                           std::ostream* log = nullptr);

  BatchOutput Process(const std::vector<RawTable>& tables) const;

  // Appends to `out`, returns this table's counters.
  BatchStats ProcessTable(const RawTable& table, std::vector<LabeledRecord>& out) const;

  // Groups in order of first appearance. Rows whose key is empty are not
  // grouped; their count goes to `keyless_rows` when non-null.
  static std::vector<RowGroup> GroupRows(const RawTable& table, const TelemetryColumns& cols,
                                         GroupingKey group_by, std::size_t* keyless_rows = nullptr);

  // Throws MalformedField when time/lat/lon cannot be parsed.
  static TelemetryPoint ParseRow(const std::vector<std::string>& row, const TelemetryColumns& cols);

  // Failure count for a table missing a required column: one per callsign
  // group (plus keyless rows), or one per row when there is no callsign
  // column. The number of groups goes to `flights` when non-null.
  static std::size_t CountUnusableFlights(const RawTable& table, GroupingKey group_by,
                                          std::size_t* flights = nullptr);

  static Flight BuildFlight(const RawTable& table, const TelemetryColumns& cols, const RowGroup& group);

private:
  FlightReducer reducer_;
  GroupingKey group_by_;
  std::ostream* log_;
};

} // namespace transit
