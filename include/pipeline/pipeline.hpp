#pragma once
#include <memory>
#include <vector>
#include "common/types.hpp"
#include "stages/stage_base.hpp"

namespace transit {

// Pipeline chains the assembly stages in order:
//   batched reduction -> normalization -> dropna -> outlier filter
// Stages can be swapped as long as they keep reading/writing the same
// AssemblyContext fields.
class Pipeline {
public:
  Pipeline();
  void Run(AssemblyContext& ctx);

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace transit
