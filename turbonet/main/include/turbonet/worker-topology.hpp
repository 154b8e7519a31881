#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>

#include "turbonet/vector.hpp"

namespace turbonet {

// Multi-process server topology: N forked workers, each running its own event loop(s) on a listening socket bound
// with SO_REUSEPORT, so that the kernel balances incoming connections between them. Nothing is shared between
// workers.
//
// The parent only supervises: a worker exiting with a non zero status or killed by a signal is logged and
// respawned (at most maxRespawns times over the topology lifetime), its siblings are not affected. A termination
// signal received by the parent (SignalHandler) is forwarded to the workers as SIGTERM.
class WorkerTopology {
 public:
  // Body of a worker process, given its index in [0, nbWorkers). Its return value is the process exit status.
  using WorkerMain = std::function<int(uint32_t workerIdx)>;

  static constexpr pid_t kNoPid = 0;

  WorkerTopology(uint32_t nbWorkers, uint32_t maxRespawns, WorkerMain workerMain,
                 std::chrono::milliseconds superviseInterval = std::chrono::milliseconds{50});

  WorkerTopology(const WorkerTopology&) = delete;
  WorkerTopology(WorkerTopology&&) = delete;
  WorkerTopology& operator=(const WorkerTopology&) = delete;
  WorkerTopology& operator=(WorkerTopology&&) = delete;

  // Stops the workers still alive.
  ~WorkerTopology();

  // Forks all workers. Throws std::system_error if fork fails.
  void start();

  // Reaps the exited workers without blocking, respawning the crashed ones.
  // Returns false once no worker is alive anymore.
  bool superviseOnce();

  // Sends SIGTERM to the live workers and waits for them, killing those still alive after 'gracePeriod'.
  void stop(std::chrono::milliseconds gracePeriod = std::chrono::seconds{5}) noexcept;

  // start(), then supervise until all workers exited or a termination signal is received (which stops them).
  void run();

  [[nodiscard]] uint32_t nbWorkers() const noexcept { return static_cast<uint32_t>(_pids.size()); }

  [[nodiscard]] uint32_t nbAlive() const noexcept { return _nbAlive; }

  [[nodiscard]] uint32_t nbRespawns() const noexcept { return _nbRespawns; }

  // Pid of worker 'workerIdx', kNoPid if it is not running.
  [[nodiscard]] pid_t pid(uint32_t workerIdx) const noexcept { return _pids[workerIdx]; }

 private:
  pid_t spawn(uint32_t workerIdx);

  void onWorkerExit(uint32_t workerIdx, int status);

  WorkerMain _workerMain;
  vector<pid_t> _pids;
  std::chrono::milliseconds _superviseInterval;
  uint32_t _maxRespawns;
  uint32_t _nbRespawns{0};
  uint32_t _nbAlive{0};
  bool _stopping{false};
};

}  // namespace turbonet
