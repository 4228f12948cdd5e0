#pragma once
#include <optional>
#include "stages/stage_base.hpp"

namespace transit {

// ======================
// Step: dropna
//
// Input:  ctx.rows
// Output: ctx.samples (rows with every column present), ctx.dropped_missing
//
// All columns are required; a row with any missing value is removed whole.
// ======================
class DropMissingStage final : public IStage {
public:
  void Run(AssemblyContext& ctx) override;

  static std::optional<TrainingSample> ToSample(const DatasetRow& row);
};

} // namespace transit
