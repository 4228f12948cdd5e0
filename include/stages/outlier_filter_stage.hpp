#pragma once
#include "stages/stage_base.hpp"

namespace transit {

// ======================
// Step: domain outlier filter (optional)
//
// Input:  ctx.samples, ctx.config.outlier_filters
// Output: ctx.samples (filtered in place), ctx.dropped_outliers
//
// Each configured column must satisfy min < value <= max; columns are
// checked independently and combined with AND. Disabled filters leave the
// samples untouched.
// ======================
class OutlierFilterStage final : public IStage {
public:
  void Run(AssemblyContext& ctx) override;

  static bool Keep(const TrainingSample& s, const OutlierFilters& filters);
};

} // namespace transit
