#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"
#include "poolkit/json/json_codec.hpp"
#include "poolkit/pool/pool_options.hpp"
#include "poolkit/pool/pool_stats.hpp"

namespace poolkit {
namespace task {
class IExecutor;
}
namespace pool {

class CapacityGate;

// Passed as a timeout to use PoolOptions::acquire_timeout.
static const std::chrono::milliseconds kDefaultAcquireTimeout(-1);

// Hooks over opaque object pointers. Only create and dispose are required.
struct ErasedHooks {
  std::function<api::Result<void*>(std::uint64_t seq)> create;
  std::function<void(void*)> dispose;
  std::function<void(void*)> on_create;
  std::function<void(void*)> on_acquire;
  std::function<void(void*)> on_release;
  std::function<void(void*)> on_destroy;
  std::function<bool(void*)> is_healthy;
  std::function<json::Json(void*)> describe;
  std::function<std::string(void*)> trace;
};

// Type-erased pool engine. Pool<T> is the public front-end.
//
// Objects are in exactly one of available, in use or pending destruction. The
// bookkeeping lock is never held while a hook runs. Borrowed objects and objects
// being created each hold one capacity token when the pool is bounded.
class POOLKIT_API PoolCore {
 public:
  // executor may be NULL; the pool then owns a single-worker executor.
  PoolCore(const PoolOptions& options, const ErasedHooks& hooks, task::IExecutor* executor);
  ~PoolCore();

  PoolCore(const PoolCore&) = delete;
  PoolCore& operator=(const PoolCore&) = delete;

  // Validates options, starts the housekeeper and creates the min_size baseline.
  api::Status Start();

  // Returns kTimeout when no capacity token frees up in time, kCreationError when the
  // factory fails and kShuttingDown after Shutdown.
  api::Result<void*> Acquire(std::chrono::milliseconds timeout = kDefaultAcquireTimeout);

  // No-op for objects that are not in use and for a second Release of the same
  // borrow. A force-reclaimed object is freed here, without returning a token.
  void Release(void* obj);

  // Idempotent. Destroys available and in-use objects.
  void Shutdown(std::chrono::milliseconds join_timeout = std::chrono::milliseconds(5000));

  // Waits for queued drain/refill work to finish.
  void Flush();

  // One housekeeping round: kill sweep, idle sweep, health sweep, drain, refill.
  void RunHousekeepingOnce();

  PoolStats Stats() const;
  const PoolOptions& options() const { return options_; }
  bool IsShutdown() const;

 private:
  typedef std::chrono::steady_clock Clock;

  struct ObjectInfo {
    std::uint64_t seq = 0;
    std::uint64_t uses = 0;
    Clock::time_point last_acquired;
    Clock::time_point last_released;
    bool acquired = false;
    bool released = false;
    bool releasing = false;  // on_release running; kill sweep skips it
  };

  api::Result<void*> CreateObject(std::uint64_t* seq);
  void RegisterLocked(void* obj, std::uint64_t seq);
  void MarkAcquiredLocked(void* obj);
  void Destroy(void* obj);
  void Dispose(void* obj);
  void RunHook(const char* name, const std::function<void(void*)>& hook, void* obj);
  bool CheckHealth(void* obj);
  void ReleaseToken(const char* where);

  void KillSweep();
  void IdleSweep();
  void HealthSweep();
  void Drain();
  void Fill();

  void ScheduleMaintenance();
  static void MaintenanceTask(void* self);
  void RunMaintenance();
  void HousekeeperLoop();

  ObjectStats DescribeLocked(void* obj, const ObjectInfo& info, Clock::time_point now) const;

  PoolOptions options_;
  ErasedHooks hooks_;
  std::unique_ptr<CapacityGate> gate_;  // NULL when unbounded

  mutable std::mutex mu_;
  std::unordered_map<void*, ObjectInfo> info_;
  std::unordered_set<void*> available_;
  std::unordered_set<void*> in_use_;
  std::vector<void*> pending_;
  // Force-reclaimed objects still referenced by their borrower, mapped to whether
  // on_destroy has run. Their memory is freed by the late Release or by Shutdown.
  std::unordered_map<void*, bool> condemned_;
  PoolCounters counters_;
  std::uint64_t next_seq_;
  std::size_t creating_;
  std::size_t min_size_;
  bool started_;
  bool shutdown_;
  Clock::time_point started_at_;
  std::chrono::system_clock::time_point started_wall_;
  Clock::time_point last_hk_;
  bool hk_ran_;

  // Serializes housekeeping rounds and post-release maintenance.
  std::mutex maintenance_mu_;

  std::chrono::milliseconds interval_;
  std::thread housekeeper_;
  std::mutex hk_mu_;
  std::condition_variable hk_cv_;
  bool hk_stop_;
  bool hk_exited_;

  task::IExecutor* executor_;
  bool owns_executor_;
  std::mutex sched_mu_;
  std::condition_variable sched_cv_;
  bool scheduled_;
  std::size_t inflight_;
};

}  // namespace pool
}  // namespace poolkit
