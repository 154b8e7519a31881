#include <turbonet/turbonet.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

using namespace turbonet;

int main(int argc, char** argv) {
  uint16_t port = 8000;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  try {
    App app(ServerConfig{}.withPort(port).withNbWorkers(1));

    app.staticRoute("/", "Hello from turbonet!\n");

    app.route("/users/<int:id>", http::Method::GET, [](const HttpRequest& req) {
      const auto id = req.pathParams().get<int64_t>("id");
      return "{\"id\":" + std::to_string(*id) + "}";
    });

    // cached for 10 seconds per captured symbol
    app.turboRoute(
        "/quote/<symbol>", http::Method::GET,
        [](const HttpRequest& req) { return "quote of " + *req.pathParams().get<std::string>("symbol") + "\n"; },
        std::chrono::seconds{10});

    app.run();  // blocking, until Ctrl+C
  } catch (const std::exception& ex) {
    std::cerr << "Server encountered error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
