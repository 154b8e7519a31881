#pragma once

#include <cstdint>
#include <memory>

#include "turbonet/server-context.hpp"
#include "turbonet/server-stats.hpp"
#include "turbonet/vector.hpp"
#include "turbonet/worker-server.hpp"

namespace turbonet {

// The event loops of one worker process (ServerConfig::eventLoopThreads), all listening on the same address and
// sharing the ServerContext. The first loop runs in the thread calling run(), the others in their own threads.
class WorkerProcess {
 public:
  // Binds every loop. Throws std::system_error if a socket cannot be set up.
  explicit WorkerProcess(ServerContext& context);

  WorkerProcess(const WorkerProcess&) = delete;
  WorkerProcess(WorkerProcess&&) = delete;
  WorkerProcess& operator=(const WorkerProcess&) = delete;
  WorkerProcess& operator=(WorkerProcess&&) = delete;

  ~WorkerProcess() = default;

  [[nodiscard]] uint16_t port() const noexcept { return _servers.front()->port(); }

  // Blocks until stop() or a termination signal, then returns the counters of all loops.
  // An exception escaping one loop stops the others and is rethrown.
  ServerStats run();

  // Thread safe.
  void stop() noexcept;

 private:
  vector<std::unique_ptr<WorkerServer>> _servers;
};

}  // namespace turbonet
