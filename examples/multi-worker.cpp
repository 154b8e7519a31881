#include <turbonet/turbonet.hpp>
#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using namespace turbonet;

int main(int argc, char** argv) {
  uint16_t port = 8000;
  uint32_t nbWorkers = 0;  // one per core
  uint32_t nbThreads = 1;
  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }
  if (argc > 2) {
    nbWorkers = static_cast<uint32_t>(std::stoul(argv[2]));
  }
  if (argc > 3) {
    nbThreads = static_cast<uint32_t>(std::stoul(argv[3]));
  }

  try {
    App app(ServerConfig{}
                .withPort(port)
                .withNbWorkers(nbWorkers)
                .withEventLoopThreads(nbThreads)
                .withRateLimit(RateLimitConfig{}.withEnabled().withCapacity(200).withRefillRate(100)));

    app.turboRoute("/pid", http::Method::GET,
                   [](const HttpRequest&) { return "served by worker " + std::to_string(::getpid()) + "\n"; });

    app.route("/echo", http::Method::POST, [](const HttpRequest& req) {
      return HandlerResult::Raw{std::string(req.body()), std::string(http::ContentTypeApplicationOctetStream)};
    });

    app.run();
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
