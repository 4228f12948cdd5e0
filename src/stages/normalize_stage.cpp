#include "stages/normalize_stage.hpp"

#include <cmath>
#include <utility>

#include "common/text_parse.hpp"

namespace transit {

namespace {

using text::Cell;

std::optional<double> Finite(const std::optional<double>& v) {
  if (v && std::isfinite(*v)) return v;
  return std::nullopt;
}

std::optional<double> Finite(double v) {
  if (std::isfinite(v)) return v;
  return std::nullopt;
}

} // namespace

std::optional<std::int64_t> NormalizeStage::NormalizeHour(const std::string& text) {
  const auto instant = text::ParseInstant(text);
  if (!instant) return std::nullopt;
  return text::FloorToInt64(*instant);
}

DatasetRow NormalizeStage::FromRecord(const LabeledRecord& rec) {
  DatasetRow row;
  row.callsign = rec.callsign;
  row.icao24 = rec.icao24;
  row.lat_deg = Finite(rec.lat_deg);
  row.lon_deg = Finite(rec.lon_deg);
  row.velocity = Finite(rec.velocity);
  row.heading = Finite(rec.heading);
  row.vertrate = Finite(rec.vertrate);
  row.baroaltitude = Finite(rec.baroaltitude);
  row.geoaltitude = Finite(rec.geoaltitude);
  row.hour_epoch_s = NormalizeHour(rec.hour);
  row.arrival_time_s = Finite(rec.arrival_time_s);
  row.transit_time_s = Finite(rec.transit_time_s);
  return row;
}

std::vector<DatasetRow> NormalizeStage::FromTable(const RawTable& table) {
  const int c_callsign = table.ColumnIndex("callsign");
  const int c_icao24 = table.ColumnIndex("icao24");
  const int c_lat = table.ColumnIndex("lat");
  const int c_lon = table.ColumnIndex("lon");
  const int c_velocity = table.ColumnIndex("velocity");
  const int c_heading = table.ColumnIndex("heading");
  const int c_vertrate = table.ColumnIndex("vertrate");
  const int c_baro = table.ColumnIndex("baroaltitude");
  const int c_geo = table.ColumnIndex("geoaltitude");
  const int c_hour = table.ColumnIndex("hour");
  const int c_arrival = table.ColumnIndex("arrival_time");
  const int c_transit = table.ColumnIndex("transit_time");

  std::vector<DatasetRow> rows;
  rows.reserve(table.rows.size());
  for (const auto& r : table.rows) {
    DatasetRow row;
    row.callsign = text::Trim(Cell(r, c_callsign));
    row.icao24 = text::Trim(Cell(r, c_icao24));
    row.lat_deg = text::ParseNumber(Cell(r, c_lat));
    row.lon_deg = text::ParseNumber(Cell(r, c_lon));
    row.velocity = text::ParseNumber(Cell(r, c_velocity));
    row.heading = text::ParseNumber(Cell(r, c_heading));
    row.vertrate = text::ParseNumber(Cell(r, c_vertrate));
    row.baroaltitude = text::ParseNumber(Cell(r, c_baro));
    row.geoaltitude = text::ParseNumber(Cell(r, c_geo));
    row.hour_epoch_s = NormalizeHour(Cell(r, c_hour));
    row.arrival_time_s = text::ParseInstant(Cell(r, c_arrival));
    row.transit_time_s = text::ParseDuration(Cell(r, c_transit));
    rows.push_back(std::move(row));
  }
  return rows;
}

void NormalizeStage::Run(AssemblyContext& ctx) {
  ctx.rows.clear();
  if (ctx.dataset_table) {
    ctx.rows = FromTable(*ctx.dataset_table);
    return;
  }
  ctx.rows.reserve(ctx.records.size());
  for (const auto& rec : ctx.records) {
    ctx.rows.push_back(FromRecord(rec));
  }
}

} // namespace transit
