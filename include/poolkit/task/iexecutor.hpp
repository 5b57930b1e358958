#pragma once

#include <cstddef>
#include <cstdint>

#include "poolkit/api/status.hpp"
#include "poolkit/api/version.hpp"

namespace poolkit {
namespace task {

typedef std::uint64_t TaskId;

struct ExecutorOptions {
  std::size_t worker_count = 0;    // 0 means hardware concurrency
  std::size_t queue_capacity = 0;  // 0 means unbounded
};

struct ExecutorStats {
  std::uint64_t submitted = 0;
  std::uint64_t completed = 0;
  std::uint64_t failed = 0;
  std::uint64_t rejected = 0;
  std::size_t queue_depth = 0;
  std::size_t queue_high_watermark = 0;
};

// Background executor used by pools for deferred maintenance work.
class IExecutor {
 public:
  virtual ~IExecutor() {}

  // Implementation name, useful to tell which backend is in use at runtime.
  virtual const char* Name() const = 0;

  virtual std::uint32_t ApiVersion() const = 0;

  // Destroys the instance. The pointer is invalid afterwards.
  virtual void Release() = 0;

  // Submit an asynchronous task.
  // Returns:
  // - kOk: task queued.
  // - kInvalidArgument: fn is null.
  // - kWouldBlock: queue_capacity reached.
  // - kShuttingDown: executor is stopping.
  // Thread safety: thread-safe.
  virtual api::Status Submit(void (*fn)(void*), void* user_data) = 0;

  // Same as Submit but returns an id usable with Wait.
  virtual api::Result<TaskId> SubmitEx(void (*fn)(void*), void* user_data) = 0;

  // Wait for one task. timeout_ms=0 waits forever; kWouldBlock on timeout.
  virtual api::Status Wait(TaskId id, std::uint32_t timeout_ms) = 0;

  // Wait until every task submitted so far has finished.
  virtual api::Status WaitAll() = 0;

  virtual api::Result<ExecutorStats> QueryStats() const = 0;
};

}  // namespace task
}  // namespace poolkit
