#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"

namespace transit::io {

// DatasetWriter writes the two products of a run as CSV, both with the
// column order of DatasetColumns():
// 1) dataset_raw.csv:   one row per reduced flight, hour kept as text,
//                       arrival_time as "YYYY-MM-DD HH:MM:SS", transit_time in seconds
// 2) dataset_clean.csv: normalized rows, hour/arrival_time as epoch seconds
class DatasetWriter {
public:
  static void WriteAll(const AssemblyContext& ctx, const std::string& output_dir);

  static void WriteRawCsv(const std::vector<LabeledRecord>& records, const std::string& output_path);
  static void WriteCleanCsv(const std::vector<TrainingSample>& samples, const std::string& output_path);
};

} // namespace transit::io
