#include "turbonet/worker-process.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <thread>

#include "turbonet/log.hpp"
#include "turbonet/server-context.hpp"
#include "turbonet/server-stats.hpp"
#include "turbonet/vector.hpp"
#include "turbonet/worker-server.hpp"

namespace turbonet {

WorkerProcess::WorkerProcess(ServerContext& context) {
  const uint32_t nbLoops = context.config().eventLoopThreads;
  _servers.reserve(nbLoops);
  _servers.push_back(std::make_unique<WorkerServer>(context));
  // an ephemeral port is resolved by the first loop, the others bind the same one
  const uint16_t port = _servers.front()->port();
  for (uint32_t loopIdx = 1; loopIdx < nbLoops; ++loopIdx) {
    _servers.push_back(std::make_unique<WorkerServer>(context, port));
  }
}

ServerStats WorkerProcess::run() {
  vector<std::exception_ptr> errors(_servers.size());
  {
    vector<std::jthread> threads;
    threads.reserve(_servers.size() - 1U);
    for (std::size_t loopIdx = 1; loopIdx < _servers.size(); ++loopIdx) {
      threads.emplace_back([this, loopIdx, &errors] {
        try {
          _servers[loopIdx]->run();
        } catch (...) {
          errors[loopIdx] = std::current_exception();
          stop();
        }
      });
    }
    try {
      _servers.front()->run();
    } catch (...) {
      errors.front() = std::current_exception();
    }
    // the first loop only returns on stop or signal, bring the others down with it
    stop();
  }

  ServerStats stats;
  for (const auto& server : _servers) {
    stats += server->stats();
  }
  for (const std::exception_ptr& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
  log::info("Worker stopped after serving {} requests", stats.totalRequestsServed);
  return stats;
}

void WorkerProcess::stop() noexcept {
  for (const auto& server : _servers) {
    server->stop();
  }
}

}  // namespace turbonet
