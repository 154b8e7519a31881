#include <turbonet/turbonet.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

using namespace turbonet;

int main(int argc, char** argv) {
  uint16_t port = 8000;
  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  try {
    App app(ServerConfig{}.withPort(port).withNbWorkers(1));

    app.staticRoute("/", R"html(<!DOCTYPE html>
<html>
<head><title>WebSocket Echo</title></head>
<body>
<h1>turbonet WebSocket endpoints</h1>
<p>ws://localhost:PORT/echo, ws://localhost:PORT/chat and ws://localhost:PORT/upper</p>
</body>
</html>
)html",
                    http::ContentTypeTextHtml);

    // handled by the server, no user code involved
    app.nativeWebSocket("/echo", websocket::NativeMode::PrefixEcho);
    app.nativeWebSocket("/chat", websocket::NativeMode::Broadcast,
                        WebSocketConfig{}.withRateLimit(20).withHeartbeatInterval(std::chrono::seconds{15}));

    websocket::WebSocketHandlers handlers;
    handlers.onConnect = [](websocket::WebSocketSession& session, const HttpRequest& req) {
      std::cout << "session " << session.id() << " opened from " << req.clientAddress() << '\n';
    };
    handlers.onMessage = [](websocket::WebSocketSession&, std::string_view text) -> std::optional<std::string> {
      std::string upper(text);
      for (char& ch : upper) {
        if (ch >= 'a' && ch <= 'z') {
          ch = static_cast<char>(ch - 'a' + 'A');
        }
      }
      return upper;
    };
    handlers.onDisconnect = [](websocket::WebSocketSession& session, websocket::CloseCode code, std::string_view) {
      std::cout << "session " << session.id() << " closed with code " << static_cast<int>(code) << '\n';
    };
    app.websocket("/upper", std::move(handlers));

    app.run();
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
