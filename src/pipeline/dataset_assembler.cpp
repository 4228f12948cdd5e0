#include "pipeline/dataset_assembler.hpp"

#include <sstream>
#include <utility>

#include "common/errors.hpp"
#include "common/run_config.hpp"
#include "pipeline/pipeline.hpp"

namespace transit {

namespace {

void RequireSamples(const AssemblyContext& ctx) {
  if (ctx.samples.empty()) {
    std::ostringstream oss;
    oss << "all " << ctx.rows.size() << " dataset rows were removed during cleaning"
        << " (dropped_missing=" << ctx.dropped_missing
        << ", dropped_outliers=" << ctx.dropped_outliers << ")";
    throw EmptySourceError(oss.str());
  }
}

} // namespace

DatasetAssembler::DatasetAssembler(RunConfig cfg, std::ostream* log)
    : cfg_(std::move(cfg)), log_(log) {
  ValidateRunConfig(cfg_);
}

AssemblyContext DatasetAssembler::Assemble(io::ITableSource& source) const {
  AssemblyContext ctx;
  ctx.config = cfg_;
  ctx.log = log_;
  ctx.source = &source;

  Pipeline pipe;
  pipe.Run(ctx);
  ctx.source = nullptr;

  if (ctx.records.empty()) {
    std::ostringstream oss;
    oss << "no source table yielded a usable flight (" << ctx.stats << ")";
    throw EmptySourceError(oss.str());
  }
  RequireSamples(ctx);
  return ctx;
}

AssemblyContext DatasetAssembler::Assemble(std::vector<RawTable> tables) const {
  io::InMemoryTableSource source(std::move(tables));
  return Assemble(source);
}

AssemblyContext DatasetAssembler::Clean(const RawTable& raw_dataset) const {
  AssemblyContext ctx;
  ctx.config = cfg_;
  ctx.log = log_;
  ctx.dataset_table = &raw_dataset;

  Pipeline pipe;
  pipe.Run(ctx);
  ctx.dataset_table = nullptr;

  RequireSamples(ctx);
  return ctx;
}

} // namespace transit
