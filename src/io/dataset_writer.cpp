#include "io/dataset_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <stdexcept>

#include "common/text_parse.hpp"

namespace fs = std::filesystem;

namespace transit::io {

namespace {

void EnsureDir(const fs::path& p) {
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

void WriteText(std::ostream& os, const std::string& s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) {
    os << s;
    return;
  }
  os << '"';
  for (char c : s) {
    if (c == '"') os << '"';
    os << c;
  }
  os << '"';
}

void WriteOpt(std::ostream& os, const std::optional<double>& v) {
  if (v) os << *v;
}

void WriteHeader(std::ostream& os) {
  const auto& cols = DatasetColumns();
  for (std::size_t i = 0; i < cols.size(); ++i) {
    if (i) os << ",";
    os << cols[i];
  }
  os << "\n";
}

std::ofstream OpenOut(const std::string& path) {
  std::ofstream ofs(path);
  if (!ofs) throw std::runtime_error("Failed to write: " + path);
  ofs << std::setprecision(12);
  return ofs;
}

} // namespace

void DatasetWriter::WriteAll(const AssemblyContext& ctx, const std::string& output_dir) {
  EnsureDir(output_dir);
  WriteRawCsv(ctx.records, (fs::path(output_dir) / "dataset_raw.csv").string());
  WriteCleanCsv(ctx.samples, (fs::path(output_dir) / "dataset_clean.csv").string());
}

void DatasetWriter::WriteRawCsv(const std::vector<LabeledRecord>& records, const std::string& output_path) {
  std::ofstream ofs = OpenOut(output_path);
  WriteHeader(ofs);
  for (const auto& r : records) {
    WriteText(ofs, r.callsign);
    ofs << ",";
    WriteText(ofs, r.icao24);
    ofs << "," << r.lat_deg << "," << r.lon_deg << ",";
    WriteOpt(ofs, r.velocity);
    ofs << ",";
    WriteOpt(ofs, r.heading);
    ofs << ",";
    WriteOpt(ofs, r.vertrate);
    ofs << ",";
    WriteOpt(ofs, r.baroaltitude);
    ofs << ",";
    WriteOpt(ofs, r.geoaltitude);
    ofs << ",";
    WriteText(ofs, r.hour);
    ofs << "," << text::FormatTimestamp(r.arrival_time_s)
        << "," << r.transit_time_s << "\n";
  }
}

void DatasetWriter::WriteCleanCsv(const std::vector<TrainingSample>& samples, const std::string& output_path) {
  std::ofstream ofs = OpenOut(output_path);
  WriteHeader(ofs);
  for (const auto& s : samples) {
    WriteText(ofs, s.callsign);
    ofs << ",";
    WriteText(ofs, s.icao24);
    ofs << "," << s.lat_deg << "," << s.lon_deg
        << "," << s.velocity << "," << s.heading << "," << s.vertrate
        << "," << s.baroaltitude << "," << s.geoaltitude
        << "," << s.hour_epoch_s << "," << s.arrival_time_s
        << "," << s.transit_time_s << "\n";
  }
}

} // namespace transit::io
