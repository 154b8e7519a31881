#pragma once

#include <cstdint>
#include <thread>

#include "turbonet/app.hpp"
#include "turbonet/worker-server.hpp"

namespace turbonet::test {

// Runs a single event loop of a frozen App in a background thread.
//   App app(ServerConfig{}.withPort(0).withNbWorkers(1));
//   app.route(...);
//   TestServer ts(app);       // bound and serving
//   ClientConnection cnx(ts.port());
// The loop is stopped and joined on destruction.
struct TestServer {
  explicit TestServer(App& app) : server(app.freeze()), loopThread([this] { server.run(); }) {}

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  [[nodiscard]] uint16_t port() const noexcept { return server.port(); }

  void stop() {
    server.stop();
    if (loopThread.joinable()) {
      loopThread.join();
    }
  }

  WorkerServer server;
  std::jthread loopThread;
};

}  // namespace turbonet::test
