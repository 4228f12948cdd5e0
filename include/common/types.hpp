#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace transit {

namespace io {
class ITableSource;
} // namespace io

// ========================
// 1) Configuration
// ========================

// Destination airport. Constant for a whole run.
struct ReferencePoint {
  double lat_deg{0.0};
  double lon_deg{0.0};
};

// Inclusive distance band [inner_nm, outer_nm] around the reference point.
struct DistanceBand {
  double inner_nm{0.0};
  double outer_nm{0.0};

  bool Contains(double distance_nm) const {
    return distance_nm >= inner_nm && distance_nm <= outer_nm;
  }
};

// The two bands used by the historical pipeline variants.
// Callers still pass a band explicitly; these are only named shortcuts.
enum class BandPreset {
  kWide,   // 48..100 NM
  kNarrow  // 48..50 NM
};

inline DistanceBand MakeBand(BandPreset preset) {
  switch (preset) {
    case BandPreset::kNarrow:
      return {48.0, 50.0};
    case BandPreset::kWide:
    default:
      return {48.0, 100.0};
  }
}

// How raw rows are grouped into flights.
// kCallsign reproduces the historical behaviour: two airframes flying the same
// callsign inside one table end up in the same flight.
enum class GroupingKey {
  kCallsign,
  kCallsignIcao24
};

// (min, max]: lower bound exclusive, upper bound inclusive.
struct ColumnRange {
  double min_exclusive{0.0};
  double max_inclusive{0.0};

  bool Accepts(double v) const { return v > min_exclusive && v <= max_inclusive; }
};

struct OutlierFilters {
  bool enabled{false};
  std::map<std::string, ColumnRange> ranges; // column name -> range

  // velocity (100,250], baroaltitude (3000,7000], vertrate (-20,5], transit_time (600,3000]
  static OutlierFilters Default();
};

struct RunConfig {
  ReferencePoint reference{51.1537, -0.1821};
  // No default: every run names its band (see MakeBand for the usual two).
  std::optional<DistanceBand> band;
  std::size_t batch_size{5};
  GroupingKey group_by{GroupingKey::kCallsign};
  OutlierFilters outlier_filters;
};

// ========================
// 2) Raw input
// ========================

// One source file, cells kept as text. Parsing happens per flight so that a
// malformed row only takes its own flight down.
struct RawTable {
  std::string name;                              // file name / label for logs
  std::vector<std::string> columns;              // header
  std::vector<std::vector<std::string>> rows;    // rows[i][j] -> columns[j]

  // -1 when the column is absent.
  int ColumnIndex(const std::string& column) const;
};

// ========================
// 3) Telemetry
// ========================

struct TelemetryPoint {
  std::string callsign;
  std::string icao24;
  double time_s{0.0};    // epoch seconds, naive UTC
  double lat_deg{0.0};
  double lon_deg{0.0};

  // Feature fields may be absent in the source; missing stays missing.
  std::optional<double> velocity;      // kt
  std::optional<double> heading;       // deg
  std::optional<double> vertrate;      // ft/min
  std::optional<double> baroaltitude;  // ft
  std::optional<double> geoaltitude;   // ft

  std::string hour; // raw text, normalized later by the assembler
};

// Points sharing one grouping key. Sorted by the reducer.
struct Flight {
  std::string key;
  std::vector<TelemetryPoint> points;
};

// ========================
// 4) Reduction output
// ========================

struct EntrySnapshot {
  TelemetryPoint point;
  double distance_nm{0.0};
  std::size_t index{0}; // position in the time-sorted flight
};

struct LabeledRecord {
  std::string callsign;
  std::string icao24;

  double lat_deg{0.0};
  double lon_deg{0.0};
  std::optional<double> velocity;
  std::optional<double> heading;
  std::optional<double> vertrate;
  std::optional<double> baroaltitude;
  std::optional<double> geoaltitude;
  std::string hour;

  double entry_distance_nm{0.0};
  double entry_time_s{0.0};
  double arrival_time_s{0.0};
  // arrival_time_s - entry_time_s, signed. Never clamped here.
  double transit_time_s{0.0};
};

// Either a record, or a skip with its reason. Skipped flights never carry a
// partially filled record.
struct ReduceResult {
  std::optional<LabeledRecord> record;
  std::string skip_reason;

  bool skipped() const { return !record.has_value(); }
};

struct BatchStats {
  std::size_t tables{0};
  std::size_t unreadable_tables{0};
  std::size_t flights{0};
  std::size_t processed{0}; // flights reduced to a record
  std::size_t skipped{0};
  std::size_t failed{0};

  BatchStats& operator+=(const BatchStats& o) {
    tables += o.tables;
    unreadable_tables += o.unreadable_tables;
    flights += o.flights;
    processed += o.processed;
    skipped += o.skipped;
    failed += o.failed;
    return *this;
  }
};

std::ostream& operator<<(std::ostream& os, const BatchStats& s);

// ========================
// 5) Normalized dataset
// ========================

// After type/unit normalization; every numeric column may still be missing.
struct DatasetRow {
  std::string callsign;
  std::string icao24;
  std::optional<double> lat_deg;
  std::optional<double> lon_deg;
  std::optional<double> velocity;
  std::optional<double> heading;
  std::optional<double> vertrate;
  std::optional<double> baroaltitude;
  std::optional<double> geoaltitude;
  std::optional<std::int64_t> hour_epoch_s;
  std::optional<double> arrival_time_s;
  std::optional<double> transit_time_s;
};

// A row that survived dropna: everything present.
struct TrainingSample {
  std::string callsign;
  std::string icao24;
  double lat_deg{0.0};
  double lon_deg{0.0};
  double velocity{0.0};
  double heading{0.0};
  double vertrate{0.0};
  double baroaltitude{0.0};
  double geoaltitude{0.0};
  std::int64_t hour_epoch_s{0};
  double arrival_time_s{0.0};
  double transit_time_s{0.0};

  // Numeric value by output column name, used by the outlier filter.
  std::optional<double> Get(const std::string& column) const;
};

// Output column order of both the raw and the clean dataset.
const std::vector<std::string>& DatasetColumns();

// ========================
// 6) Assembly context passed between stages
// ========================

struct AssemblyContext {
  RunConfig config;
  std::ostream* log{nullptr};

  // Input: either lazily read source tables, or an already persisted raw
  // dataset that only needs cleaning.
  io::ITableSource* source{nullptr};
  const RawTable* dataset_table{nullptr};

  // Intermediate / output
  std::vector<LabeledRecord> records;
  BatchStats stats;
  std::size_t batches{0};

  std::vector<DatasetRow> rows;
  std::vector<TrainingSample> samples;
  std::size_t dropped_missing{0};
  std::size_t dropped_outliers{0};
};

} // namespace transit
