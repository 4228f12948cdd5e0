#pragma once
#include <iosfwd>
#include <vector>

#include "common/types.hpp"
#include "io/table_source.hpp"

namespace transit {

// Entry point of the library: source tables in, cleaned dataset out.
//
//   DatasetAssembler assembler(cfg, &std::cout);
//   io::CsvTableSource source(paths);
//   AssemblyContext result = assembler.Assemble(source);
//   // result.records -> raw dataset, result.samples -> cleaned dataset
//
// Per-flight and per-row problems are absorbed (counted in result.stats,
// dropped_missing, dropped_outliers). Only run-level conditions throw:
//   ConfigError       invalid RunConfig (constructor)
//   EmptySourceError  no record, or no sample left after cleaning
class DatasetAssembler {
public:
  explicit DatasetAssembler(RunConfig cfg, std::ostream* log = nullptr);

  AssemblyContext Assemble(io::ITableSource& source) const;
  AssemblyContext Assemble(std::vector<RawTable> tables) const;

  // Re-runs normalization and filtering on a persisted raw dataset.
  AssemblyContext Clean(const RawTable& raw_dataset) const;

  const RunConfig& config() const { return cfg_; }

private:
  RunConfig cfg_;
  std::ostream* log_;
};

} // namespace transit
