#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "poolkit/api/status.hpp"
#include "poolkit/json/json_codec.hpp"
#include "poolkit/pool/pool_core.hpp"
#include "poolkit/pool/pool_options.hpp"
#include "poolkit/pool/pool_stats.hpp"

namespace poolkit {
namespace pool {

// Bounded or unbounded pool of expensive objects of type T.
//
// The pool owns available objects and objects pending destruction. A borrower holds
// a non-owning pointer between Acquire and Release. Objects held past
// max_borrow_kill are reclaimed by the housekeeper: on_destroy runs, the pointer
// stays dereferenceable but dead, and the borrower's late Release frees it.
template <typename T>
class Pool {
 public:
  struct Hooks {
    // Receives the per-pool creation sequence number. Ownership of the result
    // passes to the pool. May return an error or throw.
    std::function<api::Result<T*>(std::uint64_t seq)> create;
    std::function<void(T*)> on_create;
    std::function<void(T*)> on_acquire;
    std::function<void(T*)> on_release;
    std::function<void(T*)> on_destroy;
    std::function<bool(T*)> is_healthy;
    std::function<json::Json(T*)> describe;
    std::function<std::string(T*)> trace;
    // Runs after on_destroy. Defaults to delete.
    std::function<void(T*)> deleter;
  };

  // Scoped borrow. Returns the object on destruction unless released earlier.
  class Lease {
   public:
    Lease() : pool_(NULL), obj_(NULL) {}
    Lease(Lease&& other) : pool_(other.pool_), obj_(other.obj_), status_(other.status_) {
      other.pool_ = NULL;
      other.obj_ = NULL;
    }
    Lease& operator=(Lease&& other) {
      if (this != &other) {
        Release();
        pool_ = other.pool_;
        obj_ = other.obj_;
        status_ = other.status_;
        other.pool_ = NULL;
        other.obj_ = NULL;
      }
      return *this;
    }
    ~Lease() { Release(); }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    bool ok() const { return obj_ != NULL; }
    const api::Status& status() const { return status_; }
    T* get() const { return obj_; }
    T* operator->() const { return obj_; }
    T& operator*() const { return *obj_; }

    void Release() {
      if (pool_ != NULL && obj_ != NULL) pool_->Release(obj_);
      pool_ = NULL;
      obj_ = NULL;
    }

   private:
    friend class Pool;
    Lease(Pool* pool, T* obj) : pool_(pool), obj_(obj) {}
    explicit Lease(const api::Status& status) : pool_(NULL), obj_(NULL), status_(status) {}

    Pool* pool_;
    T* obj_;
    api::Status status_;
  };

  // Builds and starts a pool. executor may be NULL.
  static api::Result<std::shared_ptr<Pool> > Create(const PoolOptions& options,
                                                    const Hooks& hooks,
                                                    task::IExecutor* executor = NULL) {
    if (!hooks.create) {
      return api::Result<std::shared_ptr<Pool> >(api::Status::FromModule(
          api::StatusCode::kInvalidConfiguration,
          "pool '" + options.name + "': create hook is required", api::ErrorModule::kPool,
          api::detail_id::kPoolInvalidOptions));
    }
    std::shared_ptr<Pool> pool(new Pool(options, hooks, executor));
    api::Status st = pool->core_.Start();
    if (!st.ok()) return api::Result<std::shared_ptr<Pool> >(st);
    return api::Result<std::shared_ptr<Pool> >(pool);
  }

  api::Result<T*> Acquire(std::chrono::milliseconds timeout = kDefaultAcquireTimeout) {
    api::Result<void*> r = core_.Acquire(timeout);
    if (!r.ok()) return api::Result<T*>(r.status());
    return api::Result<T*>(static_cast<T*>(r.value()));
  }

  void Release(T* obj) { core_.Release(obj); }

  Lease Borrow(std::chrono::milliseconds timeout = kDefaultAcquireTimeout) {
    api::Result<T*> r = Acquire(timeout);
    if (!r.ok()) return Lease(r.status());
    return Lease(this, r.value());
  }

  void Shutdown(std::chrono::milliseconds join_timeout = std::chrono::milliseconds(5000)) {
    core_.Shutdown(join_timeout);
  }
  void Flush() { core_.Flush(); }
  void RunHousekeepingOnce() { core_.RunHousekeepingOnce(); }
  bool IsShutdown() const { return core_.IsShutdown(); }

  PoolStats Stats() const { return core_.Stats(); }
  json::Json StatsJson() const { return ToJson(core_.Stats()); }
  const PoolOptions& options() const { return core_.options(); }

 private:
  Pool(const PoolOptions& options, const Hooks& hooks, task::IExecutor* executor)
      : core_(options, Erase(hooks), executor) {}

  template <typename Fn>
  static std::function<void(void*)> EraseVoid(const Fn& fn) {
    if (!fn) return std::function<void(void*)>();
    return [fn](void* p) { fn(static_cast<T*>(p)); };
  }

  static ErasedHooks Erase(const Hooks& hooks) {
    ErasedHooks out;
    std::function<api::Result<T*>(std::uint64_t)> create = hooks.create;
    out.create = [create](std::uint64_t seq) -> api::Result<void*> {
      api::Result<T*> r = create(seq);
      if (!r.ok()) return api::Result<void*>(r.status());
      return api::Result<void*>(static_cast<void*>(r.value()));
    };
    std::function<void(T*)> deleter = hooks.deleter;
    out.dispose = [deleter](void* p) {
      if (deleter) {
        deleter(static_cast<T*>(p));
      } else {
        delete static_cast<T*>(p);
      }
    };
    out.on_create = EraseVoid(hooks.on_create);
    out.on_acquire = EraseVoid(hooks.on_acquire);
    out.on_release = EraseVoid(hooks.on_release);
    out.on_destroy = EraseVoid(hooks.on_destroy);
    if (hooks.is_healthy) {
      std::function<bool(T*)> fn = hooks.is_healthy;
      out.is_healthy = [fn](void* p) { return fn(static_cast<T*>(p)); };
    }
    if (hooks.describe) {
      std::function<json::Json(T*)> fn = hooks.describe;
      out.describe = [fn](void* p) { return fn(static_cast<T*>(p)); };
    }
    if (hooks.trace) {
      std::function<std::string(T*)> fn = hooks.trace;
      out.trace = [fn](void* p) { return fn(static_cast<T*>(p)); };
    }
    return out;
  }

  PoolCore core_;
};

}  // namespace pool
}  // namespace poolkit
