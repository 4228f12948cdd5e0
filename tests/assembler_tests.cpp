#include "tests/test_framework.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/text_parse.hpp"
#include "io/config_io.hpp"
#include "io/csv_reader.hpp"
#include "io/dataset_writer.hpp"
#include "io/table_source.hpp"
#include "pipeline/dataset_assembler.hpp"
#include "stages/batch_reduce_stage.hpp"
#include "stages/normalize_stage.hpp"
#include "stages/outlier_filter_stage.hpp"

// =========================
// DatasetAssembler + its stages, config and CSV collaborators
// =========================

namespace fs = std::filesystem;

namespace {

const transit::ReferencePoint kRef{51.1537, -0.1821};

const std::vector<std::string> kHeader{
    "callsign", "icao24", "time", "lat", "lon", "velocity", "heading",
    "vertrate", "baroaltitude", "geoaltitude", "hour"};

std::string Num(double v) {
  std::ostringstream oss;
  oss.precision(10);
  oss << v;
  return oss.str();
}

std::vector<std::string> Row(const std::string& callsign, double t, double dlat, double baro,
                             double velocity = 180.0) {
  return {callsign, "icao-" + callsign, Num(t), Num(kRef.lat_deg + dlat), Num(kRef.lon_deg),
          Num(velocity), "175", "-4", Num(baro), Num(baro + 150.0), "2023-08-01 14:00:00+00:00"};
}

transit::RawTable MakeTable(const std::string& name, std::vector<std::vector<std::string>> rows) {
  transit::RawTable t;
  t.name = name;
  t.columns = kHeader;
  t.rows = std::move(rows);
  return t;
}

// Four tables, a mix of reducible, skipped and failing flights.
std::vector<transit::RawTable> SampleTables() {
  const double t0 = 1690898400.0;
  auto bad = Row("BAD", t0, 1.0, 5000.0);
  bad[3] = "??";
  return {
      MakeTable("f1", {Row("A1", t0, 1.0, 6000.0), Row("A1", t0 + 1400, 0.0, 3200.0),
                       Row("A2", t0, 1.5, 7000.0), Row("A2", t0 + 1800, 0.0, 3100.0)}),
      MakeTable("f2", {Row("B1", t0, 2.5, 9000.0), Row("B1", t0 + 100, 2.4, 8000.0), bad}),
      MakeTable("f3", {Row("C1", t0 + 50, 1.2, 5500.0, 240.0), Row("C1", t0 + 1000, 0.1, 3500.0)}),
      MakeTable("f4", {Row("D1", t0, 1.1, 6500.0), Row("D1", t0 + 2000, 0.0, 3300.0),
                       Row("A1", t0 + 5000, 1.0, 6000.0), Row("A1", t0 + 6000, 0.0, 3000.0)}),
  };
}

std::vector<std::string> RecordKeys(const std::vector<transit::LabeledRecord>& recs) {
  std::vector<std::string> keys;
  for (const auto& r : recs) {
    std::ostringstream oss;
    oss.precision(12);
    oss << r.callsign << "|" << r.icao24 << "|" << r.entry_time_s << "|" << r.transit_time_s;
    keys.push_back(oss.str());
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

transit::RunConfig BaseConfig(std::size_t batch_size) {
  transit::RunConfig cfg;
  cfg.reference = kRef;
  cfg.band = transit::MakeBand(transit::BandPreset::kWide);
  cfg.batch_size = batch_size;
  return cfg;
}

transit::TrainingSample InRangeSample() {
  transit::TrainingSample s;
  s.callsign = "X";
  s.icao24 = "x";
  s.velocity = 200.0;
  s.baroaltitude = 5000.0;
  s.vertrate = -3.0;
  s.transit_time_s = 1400.0;
  return s;
}

bool Test_BatchSize_NotVisibleInOutput() {
  const auto tables = SampleTables();

  std::vector<std::vector<std::string>> results;
  std::vector<transit::BatchStats> stats;
  for (std::size_t bs : {1u, 3u, 4u, 10u}) {
    transit::DatasetAssembler assembler(BaseConfig(bs));
    const auto ctx = assembler.Assemble(tables);
    results.push_back(RecordKeys(ctx.records));
    stats.push_back(ctx.stats);
    TRANSIT_EXPECT_EQ(ctx.batches, (tables.size() + bs - 1) / bs);
  }

  TRANSIT_EXPECT_EQ(results[0].size(), static_cast<std::size_t>(5));
  for (std::size_t i = 1; i < results.size(); ++i) {
    TRANSIT_EXPECT_TRUE(results[i] == results[0]);
    TRANSIT_EXPECT_EQ(stats[i].processed, stats[0].processed);
    TRANSIT_EXPECT_EQ(stats[i].skipped, stats[0].skipped);
    TRANSIT_EXPECT_EQ(stats[i].failed, stats[0].failed);
  }
  TRANSIT_EXPECT_EQ(stats[0].skipped, static_cast<std::size_t>(1));
  TRANSIT_EXPECT_EQ(stats[0].failed, static_cast<std::size_t>(1));
  return true;
}

bool Test_BatchLog_OneLinePerBatch() {
  std::ostringstream log;
  transit::DatasetAssembler assembler(BaseConfig(2), &log);
  const auto ctx = assembler.Assemble(SampleTables());
  std::cout << log.str();
  TRANSIT_EXPECT_TRUE(log.str().find("[batch 1/2]") != std::string::npos);
  TRANSIT_EXPECT_TRUE(log.str().find("[batch 2/2]") != std::string::npos);
  TRANSIT_EXPECT_TRUE(log.str().find("[clean]") != std::string::npos);
  TRANSIT_EXPECT_EQ(ctx.samples.size(), ctx.records.size());
  return true;
}

bool Test_NormalizeHour() {
  using transit::NormalizeStage;
  TRANSIT_EXPECT_EQ(*NormalizeStage::NormalizeHour("2023-08-01 14:00:00"), static_cast<std::int64_t>(1690898400));
  // offset dropped, wall clock read as UTC
  TRANSIT_EXPECT_EQ(*NormalizeStage::NormalizeHour("2023-08-01 14:00:00+02:00"), static_cast<std::int64_t>(1690898400));
  TRANSIT_EXPECT_EQ(*NormalizeStage::NormalizeHour("2023-08-01T14:00:00-0500"), static_cast<std::int64_t>(1690898400));
  TRANSIT_EXPECT_EQ(*NormalizeStage::NormalizeHour("2024-02-29T23:59:59.750Z"), static_cast<std::int64_t>(1709251199));
  TRANSIT_EXPECT_EQ(*NormalizeStage::NormalizeHour("1690898400"), static_cast<std::int64_t>(1690898400));
  TRANSIT_EXPECT_EQ(*NormalizeStage::NormalizeHour("1970-01-01"), static_cast<std::int64_t>(0));
  TRANSIT_EXPECT_TRUE(!NormalizeStage::NormalizeHour("").has_value());
  TRANSIT_EXPECT_TRUE(!NormalizeStage::NormalizeHour("not a date").has_value());
  TRANSIT_EXPECT_TRUE(!NormalizeStage::NormalizeHour("2023-02-30 00:00:00").has_value());
  TRANSIT_EXPECT_TRUE(!NormalizeStage::NormalizeHour("2023-08-01 25:00:00").has_value());
  // numbers with no int64 second are missing, not a wrapped value
  TRANSIT_EXPECT_TRUE(!NormalizeStage::NormalizeHour("1e20").has_value());
  TRANSIT_EXPECT_TRUE(!NormalizeStage::NormalizeHour("-1e20").has_value());
  TRANSIT_EXPECT_EQ(*NormalizeStage::NormalizeHour("-0.5"), static_cast<std::int64_t>(-1));
  return true;
}

bool Test_FormatTimestamp() {
  using transit::text::FormatTimestamp;
  TRANSIT_EXPECT_EQ(FormatTimestamp(1690900200.0), std::string("2023-08-01 14:30:00"));
  TRANSIT_EXPECT_EQ(FormatTimestamp(1690900200.25), std::string("2023-08-01 14:30:00.250000"));
  TRANSIT_EXPECT_EQ(FormatTimestamp(-1.0), std::string("1969-12-31 23:59:59"));
  TRANSIT_EXPECT_NEAR(*transit::text::ParseTimestamp(FormatTimestamp(1690900200.25)), 1690900200.25, 1e-6);
  TRANSIT_EXPECT_EQ(FormatTimestamp(1e20), std::string());
  TRANSIT_EXPECT_EQ(FormatTimestamp(-1e20), std::string());
  return true;
}

bool Test_ParseDuration() {
  using transit::text::ParseDuration;
  TRANSIT_EXPECT_EQ(*ParseDuration("1400"), 1400.0);
  TRANSIT_EXPECT_EQ(*ParseDuration(" 1400.5 "), 1400.5);
  TRANSIT_EXPECT_EQ(*ParseDuration("0 days 00:23:20"), 1400.0);
  TRANSIT_EXPECT_EQ(*ParseDuration("0 days 00:23:20.500000"), 1400.5);
  TRANSIT_EXPECT_EQ(*ParseDuration("1 day 01:00:00"), 90000.0);
  TRANSIT_EXPECT_EQ(*ParseDuration("-1 days +23:36:40"), -1400.0);
  TRANSIT_EXPECT_EQ(*ParseDuration("00:10:00"), 600.0);
  TRANSIT_EXPECT_EQ(*ParseDuration("-00:10:00"), -600.0);
  TRANSIT_EXPECT_TRUE(!ParseDuration("").has_value());
  TRANSIT_EXPECT_TRUE(!ParseDuration("soon").has_value());
  TRANSIT_EXPECT_TRUE(!ParseDuration("3 weeks").has_value());
  TRANSIT_EXPECT_TRUE(!ParseDuration("nan").has_value());
  // digit runs too long for int64 are rejected, not wrapped
  TRANSIT_EXPECT_TRUE(!ParseDuration("99999999999999999999 days 00:00:00").has_value());
  TRANSIT_EXPECT_TRUE(!ParseDuration("9999999999999999999:00:00").has_value());
  TRANSIT_EXPECT_EQ(*ParseDuration("100000 days 00:00:00"), 8640000000.0);
  return true;
}

// Persisted raw dataset read back as text: malformed cells become missing and
// the row is dropped whole.
bool Test_Clean_PersistedDataset() {
  const std::string csv =
      "callsign,icao24,lat,lon,velocity,heading,vertrate,baroaltitude,geoaltitude,hour,arrival_time,transit_time\r\n"
      "BAW1,400a0b,52.15,-0.18,200,180,-3,5000,5100,2023-08-01 14:00:00+00:00,2023-08-01 14:30:00,0 days 00:23:20\r\n"
      "EZY2,400a0c,52.10,-0.20,abc,180,-3,5000,5100,2023-08-01 14:00:00,2023-08-01 14:30:00,0 days 00:20:00\r\n"
      "\"RYR,3\",400a0d,52.0,-0.1,240,90,-1,4000,4100,2023-08-01 15:00:00,1690904000,900\r\n"
      "TOM4,400a0e,52.0,-0.1,240,90,-1,4000,4100,garbage,2023-08-01 14:30:00,00:15:00\r\n"
      "\r\n"
      "JET5,400a0f,52.0,-0.1,240,90,-1,4000,,2023-08-01 15:00:00,2023-08-01 15:30:00,00:15:00\r\n";
  const transit::RawTable table = transit::io::ParseCsv(csv, "dataset_raw.csv");
  TRANSIT_EXPECT_EQ(table.rows.size(), static_cast<std::size_t>(5));

  transit::DatasetAssembler assembler(BaseConfig(5));
  const auto ctx = assembler.Clean(table);
  TRANSIT_EXPECT_EQ(ctx.rows.size(), static_cast<std::size_t>(5));
  TRANSIT_EXPECT_EQ(ctx.dropped_missing, static_cast<std::size_t>(3));
  TRANSIT_EXPECT_EQ(ctx.samples.size(), static_cast<std::size_t>(2));

  const auto& a = ctx.samples[0];
  TRANSIT_EXPECT_EQ(a.callsign, std::string("BAW1"));
  TRANSIT_EXPECT_EQ(a.hour_epoch_s, static_cast<std::int64_t>(1690898400));
  TRANSIT_EXPECT_EQ(a.arrival_time_s, 1690900200.0);
  TRANSIT_EXPECT_EQ(a.transit_time_s, 1400.0);

  const auto& b = ctx.samples[1];
  TRANSIT_EXPECT_EQ(b.callsign, std::string("RYR,3"));
  TRANSIT_EXPECT_EQ(b.arrival_time_s, 1690904000.0);
  TRANSIT_EXPECT_EQ(b.transit_time_s, 900.0);
  return true;
}

// Out-of-range hour: the row goes with dropna instead of carrying INT64_MIN.
bool Test_Clean_OutOfRangeHourDropped() {
  const std::string csv =
      "callsign,icao24,lat,lon,velocity,heading,vertrate,baroaltitude,geoaltitude,hour,arrival_time,transit_time\n"
      "BAW1,400a0b,52.15,-0.18,200,180,-3,5000,5100,1e20,2023-08-01 14:30:00,1400\n"
      "BAW2,400a0c,52.15,-0.18,200,180,-3,5000,5100,2023-08-01 14:00:00,2023-08-01 14:30:00,1400\n";
  const auto ctx = transit::DatasetAssembler(BaseConfig(5)).Clean(transit::io::ParseCsv(csv, "raw"));
  TRANSIT_EXPECT_EQ(ctx.dropped_missing, static_cast<std::size_t>(1));
  TRANSIT_EXPECT_EQ(ctx.samples.size(), static_cast<std::size_t>(1));
  TRANSIT_EXPECT_EQ(ctx.samples[0].callsign, std::string("BAW2"));
  return true;
}

// Fractional arrival times survive the raw CSV; transit stays arrival - entry.
bool Test_RawDataset_KeepsFractionalArrival() {
  transit::LabeledRecord r;
  r.callsign = "BAW1";
  r.icao24 = "400a0b";
  r.lat_deg = 52.15;
  r.lon_deg = -0.18;
  r.velocity = 200.0;
  r.heading = 180.0;
  r.vertrate = -3.0;
  r.baroaltitude = 5000.0;
  r.geoaltitude = 5100.0;
  r.hour = "2023-08-01 14:00:00";
  r.entry_time_s = 1690898799.75;
  r.arrival_time_s = 1690900200.25;
  r.transit_time_s = r.arrival_time_s - r.entry_time_s;

  const fs::path path = fs::temp_directory_path() / "flight_transit_fractional_raw.csv";
  transit::io::DatasetWriter::WriteRawCsv({r}, path.string());
  const auto ctx = transit::DatasetAssembler(BaseConfig(5)).Clean(transit::io::ReadCsvTable(path.string()));
  fs::remove(path);

  TRANSIT_EXPECT_EQ(ctx.samples.size(), static_cast<std::size_t>(1));
  TRANSIT_EXPECT_NEAR(ctx.samples[0].arrival_time_s, 1690900200.25, 1e-6);
  TRANSIT_EXPECT_NEAR(ctx.samples[0].transit_time_s, 1400.5, 1e-6);
  TRANSIT_EXPECT_NEAR(ctx.samples[0].arrival_time_s - ctx.samples[0].transit_time_s, r.entry_time_s, 1e-6);
  return true;
}

bool Test_OutlierFilter_Boundaries() {
  const auto filters = transit::OutlierFilters::Default();
  using transit::OutlierFilterStage;

  auto s = InRangeSample();
  TRANSIT_EXPECT_TRUE(OutlierFilterStage::Keep(s, filters));

  s.velocity = 260.0;
  TRANSIT_EXPECT_TRUE(!OutlierFilterStage::Keep(s, filters));
  s.velocity = 250.0; // upper bound inclusive
  TRANSIT_EXPECT_TRUE(OutlierFilterStage::Keep(s, filters));
  s.velocity = 100.0; // lower bound exclusive
  TRANSIT_EXPECT_TRUE(!OutlierFilterStage::Keep(s, filters));

  s = InRangeSample();
  s.transit_time_s = 600.0;
  TRANSIT_EXPECT_TRUE(!OutlierFilterStage::Keep(s, filters));
  s.transit_time_s = 3000.0;
  TRANSIT_EXPECT_TRUE(OutlierFilterStage::Keep(s, filters));

  s = InRangeSample();
  s.vertrate = -20.0;
  TRANSIT_EXPECT_TRUE(!OutlierFilterStage::Keep(s, filters));
  s.vertrate = 5.0;
  TRANSIT_EXPECT_TRUE(OutlierFilterStage::Keep(s, filters));

  s = InRangeSample();
  s.baroaltitude = 7000.5;
  TRANSIT_EXPECT_TRUE(!OutlierFilterStage::Keep(s, filters));
  return true;
}

bool Test_OutlierFilter_InPipeline() {
  // The five sample records all sit inside the default ranges.
  auto cfg = BaseConfig(2);
  cfg.outlier_filters = transit::OutlierFilters::Default();
  const auto all = transit::DatasetAssembler(cfg).Assemble(SampleTables());
  TRANSIT_EXPECT_EQ(all.samples.size(), static_cast<std::size_t>(5));
  TRANSIT_EXPECT_EQ(all.dropped_outliers, static_cast<std::size_t>(0));

  // Transit times are 1400, 1800, 950, 2000 and 1000 s; with (1000, 3000]
  // the 950 s record goes and so does the one sitting on the exclusive bound.
  cfg.outlier_filters.ranges["transit_time"] = {1000.0, 3000.0};
  const auto ctx = transit::DatasetAssembler(cfg).Assemble(SampleTables());
  TRANSIT_EXPECT_EQ(ctx.records.size(), static_cast<std::size_t>(5));
  TRANSIT_EXPECT_EQ(ctx.dropped_outliers, static_cast<std::size_t>(2));
  TRANSIT_EXPECT_EQ(ctx.samples.size(), static_cast<std::size_t>(3));
  for (const auto& smp : ctx.samples) {
    TRANSIT_EXPECT_TRUE(smp.transit_time_s > 1000.0 && smp.transit_time_s <= 3000.0);
  }
  return true;
}

bool Test_EmptySource_IsRunLevelError() {
  transit::DatasetAssembler assembler(BaseConfig(2));

  // every flight out of band
  std::vector<transit::RawTable> far{
      MakeTable("far", {Row("F1", 0.0, 2.5, 5000.0), Row("F1", 60.0, 2.4, 4000.0)})};
  TRANSIT_EXPECT_THROW(assembler.Assemble(far), transit::EmptySourceError);

  // no tables at all
  TRANSIT_EXPECT_THROW(assembler.Assemble(std::vector<transit::RawTable>{}), transit::EmptySourceError);

  // records exist but the filter removes all of them
  auto cfg = BaseConfig(2);
  cfg.outlier_filters.enabled = true;
  cfg.outlier_filters.ranges["velocity"] = {500.0, 600.0};
  transit::DatasetAssembler strict(cfg);
  TRANSIT_EXPECT_THROW(strict.Assemble(SampleTables()), transit::EmptySourceError);
  return true;
}

bool Test_UnreadableSource_Counted() {
  transit::io::CsvTableSource source({"/nonexistent/definitely_missing.csv"});
  transit::AssemblyContext ctx;
  ctx.config = BaseConfig(1);
  ctx.source = &source;
  transit::BatchReduceStage stage;
  stage.Run(ctx);
  TRANSIT_EXPECT_EQ(ctx.stats.tables, static_cast<std::size_t>(1));
  TRANSIT_EXPECT_EQ(ctx.stats.unreadable_tables, static_cast<std::size_t>(1));
  TRANSIT_EXPECT_TRUE(ctx.records.empty());
  return true;
}

bool Test_Config_FromJson() {
  using nlohmann::json;
  using transit::io::ConfigIO;

  const auto minimal = ConfigIO::FromJson(json::parse(R"({"band": {"inner_nm": 48, "outer_nm": 100}})"));
  TRANSIT_EXPECT_TRUE(minimal.band.has_value());
  TRANSIT_EXPECT_EQ(minimal.band->inner_nm, 48.0);
  TRANSIT_EXPECT_EQ(minimal.band->outer_nm, 100.0);
  TRANSIT_EXPECT_EQ(minimal.reference.lat_deg, 51.1537);
  TRANSIT_EXPECT_EQ(minimal.batch_size, static_cast<std::size_t>(5));
  TRANSIT_EXPECT_TRUE(minimal.group_by == transit::GroupingKey::kCallsign);
  TRANSIT_EXPECT_TRUE(!minimal.outlier_filters.enabled);

  const auto cfg = ConfigIO::FromJson(json::parse(R"({
      "reference": { "latitude": 40.6413, "longitude": -73.7781 },
      "band": { "inner_nm": 48, "outer_nm": 50 },
      "batch_size": 2,
      "group_by": "callsign+icao24",
      "outlier_filters": "default"
  })"));
  TRANSIT_EXPECT_EQ(cfg.reference.lat_deg, 40.6413);
  TRANSIT_EXPECT_EQ(cfg.band->outer_nm, 50.0);
  TRANSIT_EXPECT_EQ(cfg.batch_size, static_cast<std::size_t>(2));
  TRANSIT_EXPECT_TRUE(cfg.group_by == transit::GroupingKey::kCallsignIcao24);
  TRANSIT_EXPECT_TRUE(cfg.outlier_filters.enabled);
  TRANSIT_EXPECT_EQ(cfg.outlier_filters.ranges.size(), static_cast<std::size_t>(4));

  const auto custom = ConfigIO::FromJson(json::parse(
      R"({"band": {"inner_nm": 48, "outer_nm": 100}, "outlier_filters": {"velocity": [120, 230]}})"));
  TRANSIT_EXPECT_EQ(custom.outlier_filters.ranges.at("velocity").max_inclusive, 230.0);

  // the written form loads back to the same settings
  const auto again = ConfigIO::FromJson(ConfigIO::ToJson(cfg));
  TRANSIT_EXPECT_TRUE(again.group_by == cfg.group_by);
  TRANSIT_EXPECT_EQ(again.band->inner_nm, 48.0);
  TRANSIT_EXPECT_EQ(again.band->outer_nm, 50.0);
  TRANSIT_EXPECT_EQ(again.outlier_filters.ranges.size(), cfg.outlier_filters.ranges.size());
  return true;
}

bool Test_Config_BandIsRequired() {
  using nlohmann::json;
  using transit::io::ConfigIO;
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(json::object()), transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(json::parse(R"({"batch_size": 3})")), transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(json::parse(R"({"band": {"inner_nm": 48}})")), transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(json::parse(R"({"band": [48, 100]})")), transit::ConfigError);

  // a RunConfig built in code has no band until one is given
  transit::RunConfig cfg;
  TRANSIT_EXPECT_TRUE(!cfg.band.has_value());
  TRANSIT_EXPECT_THROW(transit::DatasetAssembler{cfg}, transit::ConfigError);

  transit::AssemblyContext ctx;
  transit::io::InMemoryTableSource source(SampleTables());
  ctx.source = &source;
  transit::BatchReduceStage stage;
  TRANSIT_EXPECT_THROW(stage.Run(ctx), transit::ConfigError);

  cfg.band = transit::MakeBand(transit::BandPreset::kNarrow);
  TRANSIT_EXPECT_EQ(transit::DatasetAssembler(cfg).config().band->outer_nm, 50.0);
  return true;
}

bool Test_Config_Rejected() {
  using nlohmann::json;
  using transit::io::ConfigIO;
  const auto with_band = [](const std::string& extra) {
    return json::parse(R"({"band": {"inner_nm": 48, "outer_nm": 100})" + extra + "}");
  };
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(with_band(R"(, "batch_size": 0)")), transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(with_band(R"(, "batch_size": "five")")), transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(json::parse(R"({"band": {"inner_nm": 60, "outer_nm": 50}})")),
                       transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(json::parse(R"({"band": {"inner_nm": "near", "outer_nm": 50}})")),
                       transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(with_band(R"(, "reference": {"latitude": 91})")), transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(with_band(R"(, "group_by": "tail")")), transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(with_band(R"(, "outlier_filters": {"speed": [1, 2]})")),
                       transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::FromJson(with_band(R"(, "outlier_filters": {"velocity": [300, 100]})")),
                       transit::ConfigError);
  TRANSIT_EXPECT_THROW(ConfigIO::Load("/nonexistent/config.json"), transit::ConfigError);

  auto cfg = BaseConfig(0);
  TRANSIT_EXPECT_THROW(transit::DatasetAssembler{cfg}, transit::ConfigError);
  return true;
}

// CSV files in, both datasets written, raw dataset read back and cleaned again.
bool Test_EndToEnd_CsvFiles() {
  const fs::path dir = fs::temp_directory_path() / "flight_transit_e2e";
  fs::remove_all(dir);
  fs::create_directories(dir);

  std::vector<std::string> paths;
  for (const auto& t : SampleTables()) {
    const fs::path p = dir / (t.name + ".csv");
    std::ofstream ofs(p);
    for (std::size_t i = 0; i < t.columns.size(); ++i) ofs << (i ? "," : "") << t.columns[i];
    ofs << "\n";
    for (const auto& r : t.rows) {
      for (std::size_t i = 0; i < r.size(); ++i) ofs << (i ? "," : "") << r[i];
      ofs << "\n";
    }
    paths.push_back(p.string());
  }

  transit::io::CsvTableSource source(paths);
  transit::DatasetAssembler assembler(BaseConfig(3));
  const auto ctx = assembler.Assemble(source);
  TRANSIT_EXPECT_EQ(ctx.records.size(), static_cast<std::size_t>(5));

  const fs::path out = dir / "out";
  transit::io::DatasetWriter::WriteAll(ctx, out.string());
  TRANSIT_EXPECT_TRUE(fs::exists(out / "dataset_raw.csv"));
  TRANSIT_EXPECT_TRUE(fs::exists(out / "dataset_clean.csv"));

  const auto raw = transit::io::ReadCsvTable((out / "dataset_raw.csv").string());
  TRANSIT_EXPECT_TRUE(raw.columns == transit::DatasetColumns());
  const auto reclean = assembler.Clean(raw);
  TRANSIT_EXPECT_EQ(reclean.samples.size(), ctx.samples.size());
  for (std::size_t i = 0; i < ctx.samples.size(); ++i) {
    TRANSIT_EXPECT_EQ(reclean.samples[i].callsign, ctx.samples[i].callsign);
    TRANSIT_EXPECT_EQ(reclean.samples[i].hour_epoch_s, ctx.samples[i].hour_epoch_s);
    TRANSIT_EXPECT_NEAR(reclean.samples[i].transit_time_s, ctx.samples[i].transit_time_s, 1e-6);
  }

  fs::remove_all(dir);
  return true;
}

} // namespace

int main() {
  using transit::test::TestCase;

  std::vector<TestCase> cases{
      {"batch size does not change the records", Test_BatchSize_NotVisibleInOutput},
      {"progress log: one line per batch", Test_BatchLog_OneLinePerBatch},
      {"hour -> epoch seconds, offset stripped", Test_NormalizeHour},
      {"epoch seconds -> timestamp text", Test_FormatTimestamp},
      {"transit_time text -> seconds", Test_ParseDuration},
      {"cleaning a persisted raw dataset (dropna)", Test_Clean_PersistedDataset},
      {"out-of-range hour becomes missing", Test_Clean_OutOfRangeHourDropped},
      {"raw dataset keeps fractional arrival times", Test_RawDataset_KeepsFractionalArrival},
      {"outlier filter: (min, max] boundaries", Test_OutlierFilter_Boundaries},
      {"outlier filter inside the pipeline", Test_OutlierFilter_InPipeline},
      {"nothing usable -> EmptySourceError", Test_EmptySource_IsRunLevelError},
      {"unreadable source file is counted, not fatal", Test_UnreadableSource_Counted},
      {"config: JSON loading", Test_Config_FromJson},
      {"config: band has no default", Test_Config_BandIsRequired},
      {"config: invalid values rejected", Test_Config_Rejected},
      {"end to end over CSV files", Test_EndToEnd_CsvFiles},
  };

  return transit::test::RunAll(cases);
}
