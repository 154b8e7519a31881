#pragma once

#include <memory>
#include <mutex>

namespace turbonet {

// Process-wide serialization point of user handler calls.
// Satisfies the BasicLockable requirements, so it can be used with std::lock_guard and std::unique_lock.
class ExecutionLock {
 public:
  ExecutionLock() noexcept = default;

  ExecutionLock(const ExecutionLock&) = delete;
  ExecutionLock& operator=(const ExecutionLock&) = delete;

  virtual ~ExecutionLock() = default;

  virtual void lock() = 0;

  virtual void unlock() noexcept = 0;

  // Whether at most one handler can run at a time in the process.
  [[nodiscard]] virtual bool serializes() const noexcept = 0;
};

// One handler at a time per process.
class GlobalExecutionLock final : public ExecutionLock {
 public:
  void lock() override { _mutex.lock(); }

  void unlock() noexcept override { _mutex.unlock(); }

  [[nodiscard]] bool serializes() const noexcept override { return true; }

 private:
  std::mutex _mutex;
};

// No serialization: handlers are expected to be safe to run concurrently.
class FreeThreadedExecutionLock final : public ExecutionLock {
 public:
  void lock() noexcept override {}

  void unlock() noexcept override {}

  [[nodiscard]] bool serializes() const noexcept override { return false; }
};

[[nodiscard]] std::unique_ptr<ExecutionLock> MakeExecutionLock(bool freeThreaded);

}  // namespace turbonet
