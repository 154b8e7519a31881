#include "turbonet/execution-lock.hpp"

#include <memory>

namespace turbonet {

std::unique_ptr<ExecutionLock> MakeExecutionLock(bool freeThreaded) {
  if (freeThreaded) {
    return std::make_unique<FreeThreadedExecutionLock>();
  }
  return std::make_unique<GlobalExecutionLock>();
}

}  // namespace turbonet
