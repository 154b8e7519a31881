#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "turbonet/execution-lock.hpp"
#include "turbonet/handler-result.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"

namespace turbonet {

// User handler of a route: receives the matched request (captures included) and returns a HandlerResult.
using RequestHandler = std::function<HandlerResult(const HttpRequest&)>;

// Any exception escaping user code, normalized at the HandlerBridge boundary.
class HandlerFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Single entry point into user code. Every call goes through the process-wide ExecutionLock, and every exception
// escaping user code is rethrown as a HandlerFailure.
class HandlerBridge {
 public:
  explicit HandlerBridge(std::unique_ptr<ExecutionLock> executionLock) : _executionLock(std::move(executionLock)) {}

  explicit HandlerBridge(bool freeThreaded = false) : HandlerBridge(MakeExecutionLock(freeThreaded)) {}

  // Runs 'handler' and converts its result to an HttpResponse, both under the execution lock.
  // Throws HandlerFailure.
  [[nodiscard]] HttpResponse invoke(const RequestHandler& handler, const HttpRequest& request) {
    return call([&handler, &request] { return handler(request).toResponse(); });
  }

  // Runs any user callable under the execution lock (hooks, WebSocket callbacks).
  // Throws HandlerFailure.
  template <class Func>
  std::invoke_result_t<Func> call(Func&& func) {
    std::lock_guard<ExecutionLock> lock(*_executionLock);
    try {
      return std::forward<Func>(func)();
    } catch (const HandlerFailure&) {
      throw;
    } catch (const std::exception& ex) {
      throw HandlerFailure(ex.what());
    } catch (...) {
      throw HandlerFailure("unknown exception");
    }
  }

  [[nodiscard]] ExecutionLock& executionLock() noexcept { return *_executionLock; }

 private:
  std::unique_ptr<ExecutionLock> _executionLock;
};

}  // namespace turbonet
