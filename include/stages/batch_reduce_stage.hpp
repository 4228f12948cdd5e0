#pragma once
#include "stages/stage_base.hpp"

namespace transit {

// ======================
// Step: batched reduction of the source tables
//
// Input:
//   ctx.source (read lazily, ctx.config.batch_size tables at a time)
//   ctx.config.reference / band / group_by
//
// Output:
//   ctx.records  concatenation of every batch, in batch order
//   ctx.stats    counters summed over all tables
//   ctx.batches
//
// Batches only bound how many tables are alive at once; the records produced
// do not depend on batch_size. An unreadable table is logged, counted in
// stats.unreadable_tables and skipped.
// ======================
class BatchReduceStage final : public IStage {
public:
  void Run(AssemblyContext& ctx) override;
};

} // namespace transit
