#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "poolkit/api/status.hpp"
#include "poolkit/log/log_manager.hpp"
#include "poolkit/pool/pool.hpp"
#include "poolkit/pool/pool_options.hpp"
#include "poolkit/proxy/context.hpp"

namespace poolkit {
namespace task {
class IExecutor;
}
namespace proxy {

struct ProxyOptions {
  Scope scope = Scope::kAuto;
  // false: each context gets its own freshly created object, destroyed on Release.
  bool use_pool = true;
  pool::PoolOptions pool;
  task::IExecutor* executor = NULL;  // for the lazily built pool, may be NULL
};

// Forwarding handle over a shared object or over objects drawn from a pool.
//
// The bound object of a context stays bound across calls until Release. A context
// never has more than one object bound at a time. The source can be changed until
// the first Get. Slots are not cleared when a thread exits or a TaskContext ends;
// use ReleaseContext for contexts that ended without Release.
template <typename T>
class Proxy {
 public:
  typedef std::function<api::Result<T*>(std::uint64_t seq)> Factory;
  typedef typename pool::Pool<T>::Hooks PoolHooks;

  // Returns its object to the proxy on destruction.
  class ScopedObject {
   public:
    ScopedObject(ScopedObject&& other)
        : proxy_(other.proxy_), obj_(other.obj_), status_(other.status_) {
      other.proxy_ = NULL;
      other.obj_ = NULL;
    }
    ~ScopedObject() {
      if (proxy_ != NULL && obj_ != NULL) {
        api::Status st = proxy_->Release();
        if (!st.ok()) log::LogManager::Log(log::LogSeverity::kError, st.ToString());
      }
    }

    ScopedObject(const ScopedObject&) = delete;
    ScopedObject& operator=(const ScopedObject&) = delete;
    ScopedObject& operator=(ScopedObject&&) = delete;

    bool ok() const { return obj_ != NULL; }
    const api::Status& status() const { return status_; }
    T* get() const { return obj_; }
    T* operator->() const { return obj_; }
    T& operator*() const { return *obj_; }

   private:
    friend class Proxy;
    ScopedObject(Proxy* proxy, const api::Result<T*>& r)
        : proxy_(proxy), obj_(r.ok() ? r.value() : NULL), status_(r.status()) {}

    Proxy* proxy_;
    T* obj_;
    api::Status status_;
  };

  explicit Proxy(const ProxyOptions& options = ProxyOptions())
      : options_(options), fixed_(NULL), used_(false), next_seq_(0) {}

  ~Proxy() {
    std::unordered_map<ContextKey, T*> slots;
    {
      std::lock_guard<std::mutex> lock(mu_);
      slots.swap(slots_);
    }
    for (typename std::unordered_map<ContextKey, T*>::iterator it = slots.begin();
         it != slots.end(); ++it) {
      GiveBack(it->second);
    }
    std::shared_ptr<pool::Pool<T> > p = pool();
    if (p) p->Shutdown();
  }

  Proxy(const Proxy&) = delete;
  Proxy& operator=(const Proxy&) = delete;

  // Binds a fixed object shared by every caller. The proxy does not own it.
  api::Status SetObject(T* obj) { return Set(obj, Factory()); }

  // Binds a factory; objects are then drawn per context.
  api::Status SetFactory(const Factory& factory) { return Set(NULL, factory); }

  // Exactly one of obj and factory must be given.
  api::Status Set(T* obj, const Factory& factory) {
    if (obj != NULL && factory) {
      return ProxyError(api::StatusCode::kInvalidConfiguration,
                        "cannot bind both an object and a factory",
                        api::detail_id::kProxyBothSources);
    }
    if (obj == NULL && !factory) {
      return ProxyError(api::StatusCode::kInvalidConfiguration,
                        "need an object or a factory", api::detail_id::kProxyNoSource);
    }
    if (obj != NULL && (options_.scope == Scope::kThread || options_.scope == Scope::kTask)) {
      return ProxyError(api::StatusCode::kInvalidConfiguration,
                        std::string("a fixed object cannot have ") + ScopeName(options_.scope) +
                            " scope",
                        api::detail_id::kProxyFixedObjectScope);
    }
    std::lock_guard<std::mutex> lock(mu_);
    if (used_) {
      return ProxyError(api::StatusCode::kInvalidConfiguration,
                        "cannot rebind a proxy after first use",
                        api::detail_id::kProxyRebindAfterUse);
    }
    fixed_ = obj;
    factory_ = factory;
    return api::Status::Ok();
  }

  // Pool parameters used when the pool is built on first Get.
  api::Status SetPoolOptions(const pool::PoolOptions& options) {
    std::lock_guard<std::mutex> lock(pool_mu_);
    if (pool_) {
      return ProxyError(api::StatusCode::kInvalidConfiguration,
                        "cannot override pool parameters once initialized",
                        api::detail_id::kProxyPoolLocked);
    }
    options_.pool = options;
    return api::Status::Ok();
  }

  // Optional lifecycle hooks for pooled or per-context objects. The factory set
  // with SetFactory takes precedence over hooks.create.
  api::Status SetPoolHooks(const PoolHooks& hooks) {
    std::lock_guard<std::mutex> lock(pool_mu_);
    if (pool_) {
      return ProxyError(api::StatusCode::kInvalidConfiguration,
                        "cannot override pool parameters once initialized",
                        api::detail_id::kProxyPoolLocked);
    }
    hooks_ = hooks;
    return api::Status::Ok();
  }

  // Resolves the object bound to the calling context, acquiring one if needed.
  api::Result<T*> Get(std::chrono::milliseconds timeout = pool::kDefaultAcquireTimeout) {
    ContextKey key = 0;
    Factory factory;
    {
      std::lock_guard<std::mutex> lock(mu_);
      used_ = true;
      if (fixed_ != NULL) return api::Result<T*>(fixed_);
      if (!factory_) {
        return api::Result<T*>(ProxyError(api::StatusCode::kInvalidConfiguration,
                                          "need an object or a factory",
                                          api::detail_id::kProxyNoSource));
      }
      factory = factory_;
    }
    api::Status st = CurrentKey(&key);
    if (!st.ok()) return api::Result<T*>(st);
    {
      std::lock_guard<std::mutex> lock(mu_);
      typename std::unordered_map<ContextKey, T*>::iterator it = slots_.find(key);
      if (it != slots_.end()) return api::Result<T*>(it->second);
    }

    api::Result<T*> obj = options_.use_pool ? AcquirePooled(factory, timeout)
                                            : CreateUnpooled(factory);
    if (!obj.ok()) return obj;

    T* winner = NULL;
    {
      std::lock_guard<std::mutex> lock(mu_);
      std::pair<typename std::unordered_map<ContextKey, T*>::iterator, bool> ins =
          slots_.insert(std::make_pair(key, obj.value()));
      winner = ins.first->second;
    }
    // Another caller sharing this key bound first.
    if (winner != obj.value()) GiveBack(obj.value());
    return api::Result<T*>(winner);
  }

  // Applies fn(T&) to the bound object. The object stays bound afterwards.
  template <typename Fn>
  api::Status Forward(Fn fn, std::chrono::milliseconds timeout = pool::kDefaultAcquireTimeout) {
    api::Result<T*> obj = Get(timeout);
    if (!obj.ok()) return obj.status();
    fn(*obj.value());
    return api::Status::Ok();
  }

  bool HasObject() const {
    ContextKey key = 0;
    std::lock_guard<std::mutex> lock(mu_);
    if (fixed_ != NULL) return true;
    if (!CurrentKey(&key).ok()) return false;
    return slots_.find(key) != slots_.end();
  }

  // Returns the calling context's object. No-op for a fixed object or an empty slot.
  api::Status Release() {
    ContextKey key = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (fixed_ != NULL) return api::Status::Ok();
    }
    api::Status st = CurrentKey(&key);
    if (!st.ok()) return st;
    return ReleaseContext(key);
  }

  // Returns the object bound to an arbitrary context, e.g. a TaskContext that has
  // ended or a thread that has exited without calling Release. No-op for an empty slot.
  api::Status ReleaseContext(ContextKey key) {
    T* obj = NULL;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (fixed_ != NULL) return api::Status::Ok();
      typename std::unordered_map<ContextKey, T*>::iterator it = slots_.find(key);
      if (it == slots_.end()) return api::Status::Ok();
      obj = it->second;
      slots_.erase(it);
    }
    GiveBack(obj);
    return api::Status::Ok();
  }

  // Get now, Release when the returned guard goes out of scope.
  ScopedObject Scoped(std::chrono::milliseconds timeout = pool::kDefaultAcquireTimeout) {
    return ScopedObject(this, Get(timeout));
  }

  std::size_t BoundCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    return slots_.size();
  }

  // NULL until the first pooled Get.
  std::shared_ptr<pool::Pool<T> > pool() const {
    std::lock_guard<std::mutex> lock(pool_mu_);
    return pool_;
  }

  // kAuto resolved against the current binding.
  Scope scope() const {
    std::lock_guard<std::mutex> lock(mu_);
    return EffectiveScopeLocked();
  }

 private:
  static api::Status ProxyError(api::StatusCode code, const std::string& message,
                                std::uint32_t detail) {
    return api::Status::FromModule(code, message, api::ErrorModule::kProxy, detail);
  }

  Scope EffectiveScopeLocked() const {
    if (options_.scope != Scope::kAuto) return options_.scope;
    return fixed_ != NULL ? Scope::kShared : Scope::kThread;
  }

  api::Status CurrentKey(ContextKey* key) const {
    const Scope scope = options_.scope == Scope::kAuto ? Scope::kThread : options_.scope;
    switch (scope) {
      case Scope::kShared:
        *key = kSharedContextKey;
        return api::Status::Ok();
      case Scope::kTask:
        *key = CurrentTaskKey();
        if (*key == 0) {
          return ProxyError(api::StatusCode::kInvalidConfiguration,
                            "task-scoped proxy used outside a TaskContext",
                            api::detail_id::kProxyNoTaskContext);
        }
        return api::Status::Ok();
      default:
        *key = CurrentThreadKey();
        return api::Status::Ok();
    }
  }

  api::Result<T*> AcquirePooled(const Factory& factory, std::chrono::milliseconds timeout) {
    std::shared_ptr<pool::Pool<T> > p;
    {
      std::lock_guard<std::mutex> lock(pool_mu_);
      if (!pool_) {
        PoolHooks hooks = hooks_;
        hooks.create = factory;
        api::Result<std::shared_ptr<pool::Pool<T> > > created =
            pool::Pool<T>::Create(options_.pool, hooks, options_.executor);
        if (!created.ok()) return api::Result<T*>(created.status());
        pool_ = created.value();
      }
      p = pool_;
    }
    return p->Acquire(timeout);
  }

  api::Result<T*> CreateUnpooled(const Factory& factory) {
    std::uint64_t seq = 0;
    PoolHooks hooks;
    {
      std::lock_guard<std::mutex> lock(pool_mu_);
      seq = next_seq_++;
      hooks = hooks_;
    }
    const std::uint32_t detail = api::detail_id::kProxyCreateFailed;
    api::Result<T*> r(
        ProxyError(api::StatusCode::kCreationError, "factory returned nothing", detail));
    try {
      r = factory(seq);
    } catch (const std::exception& ex) {
      return api::Result<T*>(ProxyError(api::StatusCode::kCreationError,
                                        std::string("factory failed: ") + ex.what(), detail));
    } catch (...) {
      return api::Result<T*>(ProxyError(api::StatusCode::kCreationError,
                                        "factory failed: unknown exception", detail));
    }
    if (!r.ok()) {
      return api::Result<T*>(ProxyError(api::StatusCode::kCreationError,
                                        "factory failed: " + r.status().message(), detail));
    }
    if (r.value() == NULL) {
      return api::Result<T*>(ProxyError(api::StatusCode::kCreationError,
                                        "factory returned a null object", detail));
    }
    RunHook("on_create", hooks.on_create, r.value());
    return r;
  }

  static void RunHook(const char* name, const std::function<void(T*)>& hook, T* obj) {
    if (!hook) return;
    try {
      hook(obj);
    } catch (const std::exception& ex) {
      log::LogManager::Log(log::LogSeverity::kError,
                           std::string("proxy: ") + name + " hook failed: " + ex.what());
    } catch (...) {
      log::LogManager::Log(log::LogSeverity::kError,
                           std::string("proxy: ") + name + " hook failed: unknown exception");
    }
  }

  // Hands an object back to where it came from.
  void GiveBack(T* obj) {
    if (options_.use_pool) {
      std::shared_ptr<pool::Pool<T> > p = pool();
      if (p) p->Release(obj);
      return;
    }
    PoolHooks hooks;
    {
      std::lock_guard<std::mutex> lock(pool_mu_);
      hooks = hooks_;
    }
    RunHook("on_destroy", hooks.on_destroy, obj);
    if (hooks.deleter) {
      RunHook("deleter", hooks.deleter, obj);
    } else {
      delete obj;
    }
  }

  ProxyOptions options_;
  mutable std::mutex mu_;  // source binding and slots
  T* fixed_;
  Factory factory_;
  bool used_;
  std::unordered_map<ContextKey, T*> slots_;

  mutable std::mutex pool_mu_;  // pool, hooks and unpooled sequence
  PoolHooks hooks_;
  std::shared_ptr<pool::Pool<T> > pool_;
  std::uint64_t next_seq_;
};

}  // namespace proxy
}  // namespace poolkit
