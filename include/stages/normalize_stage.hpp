#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stages/stage_base.hpp"

namespace transit {

// ======================
// Step: type/unit normalization
//
// Input:
//   ctx.dataset_table when set (a persisted raw dataset read back as text),
//   otherwise ctx.records
//
// Output:
//   ctx.rows, one per input row
//
// Rules:
//   hour          -> instant, offset dropped (naive UTC), epoch seconds
//   arrival_time  -> epoch seconds
//   transit_time  -> seconds (number, "HH:MM:SS" or "N days HH:MM:SS")
//   other numeric -> double
// Anything that does not convert becomes missing; nothing here throws.
// ======================
class NormalizeStage final : public IStage {
public:
  void Run(AssemblyContext& ctx) override;

  static DatasetRow FromRecord(const LabeledRecord& rec);
  static std::vector<DatasetRow> FromTable(const RawTable& table);

  static std::optional<std::int64_t> NormalizeHour(const std::string& text);
};

} // namespace transit
