#include "stages/outlier_filter_stage.hpp"

#include <utility>
#include <vector>

#include "common/errors.hpp"

namespace transit {

bool OutlierFilterStage::Keep(const TrainingSample& s, const OutlierFilters& filters) {
  for (const auto& kv : filters.ranges) {
    const auto v = s.Get(kv.first);
    if (!v) throw ConfigError("outlier filter on unknown column: " + kv.first);
    if (!kv.second.Accepts(*v)) return false;
  }
  return true;
}

void OutlierFilterStage::Run(AssemblyContext& ctx) {
  ctx.dropped_outliers = 0;
  const auto& filters = ctx.config.outlier_filters;
  if (!filters.enabled || filters.ranges.empty()) return;

  std::vector<TrainingSample> kept;
  kept.reserve(ctx.samples.size());
  for (auto& s : ctx.samples) {
    if (Keep(s, filters)) {
      kept.push_back(std::move(s));
    } else {
      ++ctx.dropped_outliers;
    }
  }
  ctx.samples = std::move(kept);
}

} // namespace transit
