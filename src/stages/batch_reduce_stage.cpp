#include "stages/batch_reduce_stage.hpp"

#include <algorithm>
#include <iterator>
#include <ostream>
#include <utility>
#include <vector>

#include "common/errors.hpp"
#include "io/table_source.hpp"
#include "reduce/batch_processor.hpp"

namespace transit {

void BatchReduceStage::Run(AssemblyContext& ctx) {
  ctx.records.clear();
  ctx.stats = {};
  ctx.batches = 0;
  if (!ctx.source) return;

  if (!ctx.config.band) throw ConfigError("distance band not set");

  const TrajectoryBatchProcessor processor(ctx.config.reference, *ctx.config.band,
                                           ctx.config.group_by, ctx.log);

  const std::size_t n = ctx.source->Count();
  const std::size_t bs = std::max<std::size_t>(1, ctx.config.batch_size);
  const std::size_t total_batches = (n + bs - 1) / bs;

  for (std::size_t begin = 0; begin < n; begin += bs) {
    const std::size_t end = std::min(n, begin + bs);

    // 1) read this batch only
    std::vector<RawTable> tables;
    tables.reserve(end - begin);
    BatchStats read_stats;
    for (std::size_t i = begin; i < end; ++i) {
      try {
        tables.push_back(ctx.source->Load(i));
      } catch (const SourceReadError& e) {
        ++read_stats.tables;
        ++read_stats.unreadable_tables;
        if (ctx.log) *ctx.log << "[table #" << i << "] unreadable: " << e.what() << "\n";
      }
    }

    // 2) reduce, 3) concatenate
    BatchOutput out = processor.Process(tables);
    out.stats += read_stats;
    ctx.records.insert(ctx.records.end(),
                       std::make_move_iterator(out.records.begin()),
                       std::make_move_iterator(out.records.end()));
    ctx.stats += out.stats;
    ++ctx.batches;

    if (ctx.log) {
      *ctx.log << "[batch " << ctx.batches << "/" << total_batches << "] " << out.stats << "\n";
    }
  }
}

} // namespace transit
