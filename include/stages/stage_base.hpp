#pragma once
#include "common/types.hpp"

namespace transit {

// Every step of dataset assembly is a Stage; input and output travel through
// AssemblyContext, and Pipeline calls the stages in order.
// A stage must be safe to run again on the same context: it overwrites its
// own outputs instead of appending to leftovers.
class IStage {
public:
  virtual ~IStage() = default;
  virtual void Run(AssemblyContext& ctx) = 0;
};

} // namespace transit
