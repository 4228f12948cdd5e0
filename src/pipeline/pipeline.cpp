#include "pipeline/pipeline.hpp"

#include <ostream>

#include "stages/batch_reduce_stage.hpp"
#include "stages/normalize_stage.hpp"
#include "stages/drop_missing_stage.hpp"
#include "stages/outlier_filter_stage.hpp"

namespace transit {

Pipeline::Pipeline() {
  stages_.emplace_back(std::make_unique<BatchReduceStage>());
  stages_.emplace_back(std::make_unique<NormalizeStage>());
  stages_.emplace_back(std::make_unique<DropMissingStage>());
  stages_.emplace_back(std::make_unique<OutlierFilterStage>());
}

void Pipeline::Run(AssemblyContext& ctx) {
  for (auto& stage : stages_) {
    stage->Run(ctx);
  }

  if (ctx.log) {
    *ctx.log << "[clean] rows=" << ctx.rows.size()
             << " dropped_missing=" << ctx.dropped_missing
             << " dropped_outliers=" << ctx.dropped_outliers
             << " samples=" << ctx.samples.size() << "\n";
  }
}

} // namespace transit
