#include "turbonet/worker-topology.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "turbonet/errno-throw.hpp"
#include "turbonet/log.hpp"
#include "turbonet/signal-handler.hpp"

namespace turbonet {

WorkerTopology::WorkerTopology(uint32_t nbWorkers, uint32_t maxRespawns, WorkerMain workerMain,
                               std::chrono::milliseconds superviseInterval)
    : _workerMain(std::move(workerMain)),
      _pids(nbWorkers, kNoPid),
      _superviseInterval(superviseInterval),
      _maxRespawns(maxRespawns) {
  if (nbWorkers == 0) {
    throw std::invalid_argument("at least one worker is needed");
  }
  if (!_workerMain) {
    throw std::invalid_argument("worker main function is empty");
  }
}

WorkerTopology::~WorkerTopology() {
  if (_nbAlive != 0) {
    stop();
  }
}

void WorkerTopology::start() {
  _stopping = false;
  for (uint32_t workerIdx = 0; workerIdx < nbWorkers(); ++workerIdx) {
    if (_pids[workerIdx] == kNoPid) {
      _pids[workerIdx] = spawn(workerIdx);
      ++_nbAlive;
    }
  }
  log::info("{} worker(s) started", _nbAlive);
}

pid_t WorkerTopology::spawn(uint32_t workerIdx) {
  const pid_t pid = ::fork();
  if (pid == -1) {
    ThrowSystemError("fork failed for worker {}", workerIdx);
  }
  if (pid == 0) {
    // Child: a stop request inherited from the parent must not stop this fresh worker.
    SignalHandler::ResetStopRequest();
    int exitStatus = EXIT_FAILURE;
    try {
      exitStatus = _workerMain(workerIdx);
    } catch (const std::exception& ex) {
      log::critical("Worker {} terminated by an exception: {}", workerIdx, ex.what());
    }
    log::default_logger()->flush();
    // no atexit handlers nor static destructors: they belong to the parent
    ::_exit(exitStatus);
  }
  log::debug("Worker {} forked with pid {}", workerIdx, pid);
  return pid;
}

bool WorkerTopology::superviseOnce() {
  for (uint32_t workerIdx = 0; workerIdx < nbWorkers(); ++workerIdx) {
    const pid_t pid = _pids[workerIdx];
    if (pid == kNoPid) {
      continue;
    }
    int status = 0;
    const pid_t ret = ::waitpid(pid, &status, WNOHANG);
    if (ret == 0) {
      continue;
    }
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      // ECHILD: reaped elsewhere, consider it gone
      log::error("waitpid failed for worker {} (pid {}): {}", workerIdx, pid, std::strerror(errno));
      _pids[workerIdx] = kNoPid;
      --_nbAlive;
      continue;
    }
    onWorkerExit(workerIdx, status);
  }
  return _nbAlive != 0;
}

void WorkerTopology::onWorkerExit(uint32_t workerIdx, int status) {
  const pid_t pid = std::exchange(_pids[workerIdx], kNoPid);
  --_nbAlive;
  if (WIFEXITED(status) && WEXITSTATUS(status) == EXIT_SUCCESS) {
    log::info("Worker {} (pid {}) exited", workerIdx, pid);
    return;
  }
  if (WIFSIGNALED(status)) {
    log::error("Worker {} (pid {}) killed by signal {} ({})", workerIdx, pid, WTERMSIG(status),
               ::strsignal(WTERMSIG(status)));
  } else {
    log::error("Worker {} (pid {}) exited with status {}", workerIdx, pid, WEXITSTATUS(status));
  }
  if (_stopping) {
    return;
  }
  if (_nbRespawns >= _maxRespawns) {
    log::error("Respawn budget of {} exhausted, worker {} is not restarted", _maxRespawns, workerIdx);
    return;
  }
  ++_nbRespawns;
  log::warn("Respawning worker {} ({}/{})", workerIdx, _nbRespawns, _maxRespawns);
  _pids[workerIdx] = spawn(workerIdx);
  ++_nbAlive;
}

void WorkerTopology::stop(std::chrono::milliseconds gracePeriod) noexcept {
  _stopping = true;
  for (const pid_t pid : _pids) {
    if (pid != kNoPid && ::kill(pid, SIGTERM) != 0) {
      log::error("Unable to send SIGTERM to pid {}: {}", pid, std::strerror(errno));
    }
  }
  const auto deadline = std::chrono::steady_clock::now() + gracePeriod;
  while (superviseOnce()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      log::warn("{} worker(s) still alive after {} ms, killing them", _nbAlive, gracePeriod.count());
      for (const pid_t pid : _pids) {
        if (pid != kNoPid && ::kill(pid, SIGKILL) != 0) {
          log::error("Unable to kill pid {}: {}", pid, std::strerror(errno));
        }
      }
      while (superviseOnce()) {
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
      }
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  log::info("All workers stopped");
}

void WorkerTopology::run() {
  start();
  while (superviseOnce()) {
    if (SignalHandler::IsStopRequested()) {
      log::info("Termination signal received, stopping {} worker(s)", _nbAlive);
      stop();
      return;
    }
    std::this_thread::sleep_for(_superviseInterval);
  }
  log::info("No worker left, supervisor exits");
}

}  // namespace turbonet
