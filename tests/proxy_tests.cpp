#include "poolkit/proxy/proxy.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>

namespace api = poolkit::api;
namespace pool = poolkit::pool;
namespace proxy = poolkit::proxy;

namespace {

// Capability interface shared by the real session and its proxying front.
class ISession {
 public:
  virtual ~ISession() {}
  virtual std::uint64_t Id() const = 0;
  virtual api::Result<std::string> Fetch(const std::string& url) = 0;
};

class Session : public ISession {
 public:
  explicit Session(std::uint64_t id) : id_(id), fetches_(0) {}
  std::uint64_t Id() const override { return id_; }
  api::Result<std::string> Fetch(const std::string& url) override {
    ++fetches_;
    return api::Result<std::string>("session-" + std::to_string(id_) + ":" + url);
  }
  int fetches() const { return fetches_; }

 private:
  std::uint64_t id_;
  int fetches_;
};

// Used exactly like an ISession; every call runs on the context's bound session.
class ProxiedSession : public ISession {
 public:
  explicit ProxiedSession(proxy::Proxy<ISession>* target) : target_(target) {}

  std::uint64_t Id() const override {
    std::uint64_t id = 0;
    api::Status st = target_->Forward([&id](ISession& s) { id = s.Id(); });
    return st.ok() ? id : ~0ULL;
  }

  api::Result<std::string> Fetch(const std::string& url) override {
    api::Result<std::string> out(api::Status(api::StatusCode::kInternalError, "not forwarded"));
    api::Status st = target_->Forward([&out, &url](ISession& s) { out = s.Fetch(url); });
    if (!st.ok()) return api::Result<std::string>(st);
    return out;
  }

 private:
  proxy::Proxy<ISession>* target_;
};

struct Counters {
  Counters() : created(0), destroyed(0) {}
  std::atomic<int> created;
  std::atomic<int> destroyed;
};

proxy::Proxy<ISession>::Factory SessionFactory(Counters* c) {
  return [c](std::uint64_t seq) {
    c->created.fetch_add(1);
    return api::Result<ISession*>(new Session(seq));
  };
}

proxy::Proxy<ISession>::PoolHooks CountingHooks(Counters* c) {
  proxy::Proxy<ISession>::PoolHooks hooks;
  hooks.on_destroy = [c](ISession*) { c->destroyed.fetch_add(1); };
  return hooks;
}

proxy::ProxyOptions PooledOptions(proxy::Scope scope, std::size_t max_size) {
  proxy::ProxyOptions options;
  options.scope = scope;
  options.pool.name = "sessions";
  options.pool.max_size = max_size;
  options.pool.min_size = 0;
  options.pool.housekeeper_thread = false;
  return options;
}

bool HasSymbol(const api::Status& st, const char* symbol) {
  const api::ErrorCatalogEntry* entry = api::FindErrorCatalogEntry(st.hex_code());
  return entry != NULL && std::string(entry->symbol) == symbol;
}

}  // namespace

bool TestSharedObject() {
  Session shared(7);
  proxy::Proxy<ISession> p;
  if (!p.SetObject(&shared).ok()) return false;
  if (p.scope() != proxy::Scope::kShared) return false;

  ISession* from_thread = NULL;
  std::thread other([&]() {
    api::Result<ISession*> r = p.Get();
    if (r.ok()) from_thread = r.value();
  });
  other.join();
  api::Result<ISession*> here = p.Get();
  const bool released = p.Release().ok();
  return here.ok() && here.value() == &shared && from_thread == &shared && released &&
         p.HasObject() && p.BoundCount() == 0 && !p.pool();
}

bool TestBothOrNeitherSource() {
  Session obj(1);
  Counters c;
  proxy::Proxy<ISession> p;
  api::Status both = p.Set(&obj, SessionFactory(&c));
  api::Status neither = p.Set(NULL, proxy::Proxy<ISession>::Factory());
  api::Result<ISession*> unbound = p.Get();
  return HasSymbol(both, "PROXY_BOTH_SOURCES") && HasSymbol(neither, "PROXY_NO_SOURCE") &&
         HasSymbol(unbound.status(), "PROXY_NO_SOURCE") && c.created.load() == 0;
}

bool TestRebindAfterUseFails() {
  Session obj(1);
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kAuto, 2));
  if (!p.SetObject(&obj).ok()) return false;
  // Changing the source before first use is allowed.
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;
  if (p.scope() != proxy::Scope::kThread) return false;
  api::Result<ISession*> r = p.Get();
  api::Status rebind = p.SetObject(&obj);
  const bool released = p.Release().ok();
  return r.ok() && r.value() != &obj && released &&
         rebind.code() == api::StatusCode::kInvalidConfiguration &&
         HasSymbol(rebind, "PROXY_REBIND_AFTER_USE");
}

bool TestFixedObjectRejectsThreadScope() {
  Session obj(1);
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kThread, 2));
  proxy::Proxy<ISession> task(PooledOptions(proxy::Scope::kTask, 2));
  return HasSymbol(p.SetObject(&obj), "PROXY_FIXED_OBJECT_SCOPE") &&
         HasSymbol(task.SetObject(&obj), "PROXY_FIXED_OBJECT_SCOPE");
}

bool TestPoolOptionsLockedOncePoolExists() {
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kThread, 2));
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;
  pool::PoolOptions wider;
  wider.name = "sessions";
  wider.max_size = 4;
  wider.min_size = 0;
  wider.housekeeper_thread = false;
  if (!p.SetPoolOptions(wider).ok()) return false;
  api::Result<ISession*> r = p.Get();
  api::Status late = p.SetPoolOptions(wider);
  const std::size_t max_size = p.pool() ? p.pool()->options().max_size : 0;
  const bool released = p.Release().ok();
  return r.ok() && max_size == 4 && released && HasSymbol(late, "PROXY_POOL_LOCKED");
}

bool TestThreadScopeDistinctObjects() {
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kThread, 4));
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;

  std::atomic<int> bound(0);
  std::atomic<bool> stable(true);
  ISession* seen[2] = {NULL, NULL};
  std::thread workers[2];
  for (int i = 0; i < 2; ++i) {
    workers[i] = std::thread([&, i]() {
      api::Result<ISession*> first = p.Get();
      if (!first.ok()) return;
      seen[i] = first.value();
      bound.fetch_add(1);
      // Hold the binding until both threads are bound.
      while (bound.load() < 2) std::this_thread::sleep_for(std::chrono::milliseconds(1));
      api::Result<ISession*> again = p.Get();
      if (!again.ok() || again.value() != first.value()) stable.store(false);
      if (!p.Release().ok()) stable.store(false);
    });
  }
  workers[0].join();
  workers[1].join();
  std::shared_ptr<pool::Pool<ISession> > backing = p.pool();
  return seen[0] != NULL && seen[1] != NULL && seen[0] != seen[1] && stable.load() &&
         p.BoundCount() == 0 && backing && backing->Stats().nusing == 0;
}

bool TestReleaseThenReacquire() {
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kThread, 1));
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;
  if (!p.Release().ok()) return false;  // nothing bound yet

  api::Result<ISession*> first = p.Get();
  if (!first.ok() || !p.HasObject() || p.BoundCount() != 1) return false;
  if (!p.Release().ok() || p.HasObject()) return false;
  if (p.pool()->Stats().nusing != 0) return false;

  api::Result<ISession*> second = p.Get();
  const bool ok = second.ok() && p.pool()->Stats().nusing == 1;
  return ok && p.Release().ok();
}

bool TestTaskScope() {
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kTask, 4));
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;

  api::Result<ISession*> outside = p.Get();
  if (outside.ok() || !HasSymbol(outside.status(), "PROXY_NO_TASK_CONTEXT")) return false;
  if (p.Release().code() != api::StatusCode::kInvalidConfiguration) return false;
  if (p.HasObject()) return false;

  bool ok = true;
  {
    proxy::TaskContext request_a;
    api::Result<ISession*> a = p.Get();
    {
      proxy::TaskContext request_b;
      api::Result<ISession*> b = p.Get();
      ok = ok && a.ok() && b.ok() && a.value() != b.value() && p.BoundCount() == 2;
      ok = ok && p.Release().ok();
    }
    api::Result<ISession*> a_again = p.Get();
    ok = ok && a_again.ok() && a_again.value() == a.value() && p.BoundCount() == 1;
    ok = ok && p.Release().ok();
  }
  return ok && proxy::CurrentTaskKey() == 0 && p.BoundCount() == 0;
}

bool TestTaskContextAcrossThreads() {
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kTask, 4));
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;

  const proxy::ContextKey key = proxy::TaskContext::NextKey();
  ISession* first = NULL;
  ISession* second = NULL;
  std::thread t1([&]() {
    proxy::TaskContext ctx(key);
    api::Result<ISession*> r = p.Get();
    if (r.ok()) first = r.value();
  });
  t1.join();
  std::thread t2([&]() {
    proxy::TaskContext ctx(key);
    api::Result<ISession*> r = p.Get();
    if (r.ok()) second = r.value();
    if (!p.Release().ok()) second = NULL;
  });
  t2.join();
  return first != NULL && first == second && p.BoundCount() == 0;
}

bool TestSharedScopeWithFactory() {
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kShared, 2));
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;
  ISession* from_thread = NULL;
  std::thread other([&]() {
    api::Result<ISession*> r = p.Get();
    if (r.ok()) from_thread = r.value();
  });
  other.join();
  api::Result<ISession*> here = p.Get();
  const bool ok = here.ok() && here.value() == from_thread && c.created.load() == 1 &&
                  p.BoundCount() == 1;
  return ok && p.Release().ok() && p.BoundCount() == 0;
}

bool TestUnpooledMode() {
  Counters c;
  proxy::ProxyOptions options;
  options.use_pool = false;
  proxy::Proxy<ISession> p(options);
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;
  if (!p.SetPoolHooks(CountingHooks(&c)).ok()) return false;

  api::Result<ISession*> first = p.Get();
  if (!first.ok() || first.value()->Id() != 0) return false;
  if (!p.Release().ok() || c.destroyed.load() != 1) return false;
  api::Result<ISession*> second = p.Get();
  if (!second.ok() || second.value()->Id() != 1) return false;
  return !p.pool() && p.Release().ok() && c.created.load() == 2 && c.destroyed.load() == 2;
}

bool TestScopedHelper() {
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kThread, 1));
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;
  {
    proxy::Proxy<ISession>::ScopedObject s = p.Scoped();
    if (!s.ok() || !p.HasObject()) return false;
    api::Result<std::string> body = s->Fetch("/status");
    if (!body.ok() || body.value() != "session-0:/status") return false;
  }
  if (p.HasObject() || p.pool()->Stats().nusing != 0) return false;

  // With the only object held by another thread the helper reports the timeout.
  std::atomic<bool> held(false);
  std::atomic<bool> done(false);
  std::thread holder([&]() {
    proxy::Proxy<ISession>::ScopedObject s = p.Scoped();
    held.store(s.ok());
    while (!done.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  });
  while (!held.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  bool timed_out = false;
  {
    proxy::Proxy<ISession>::ScopedObject s = p.Scoped(std::chrono::milliseconds(30));
    timed_out = !s.ok() && s.status().code() == api::StatusCode::kTimeout;
  }
  done.store(true);
  holder.join();
  return timed_out && p.pool()->Stats().nusing == 0;
}

bool TestForwardPropagatesCreationError() {
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kThread, 2));
  proxy::Proxy<ISession>::Factory failing = [](std::uint64_t) {
    return api::Result<ISession*>(api::Status(api::StatusCode::kIoError, "upstream refused"));
  };
  if (!p.SetFactory(failing).ok()) return false;
  bool called = false;
  api::Status st = p.Forward([&called](ISession&) { called = true; });
  return !called && st.code() == api::StatusCode::kCreationError &&
         st.message().find("upstream refused") != std::string::npos && !p.HasObject();
}

bool TestInterfaceDelegation() {
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kThread, 2));
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;
  ProxiedSession front(&p);
  ISession& session = front;

  api::Result<std::string> a = session.Fetch("/a");
  api::Result<std::string> b = session.Fetch("/b");
  const std::uint64_t id = session.Id();
  api::Result<ISession*> bound = p.Get();
  const int fetches = bound.ok() ? static_cast<Session*>(bound.value())->fetches() : -1;
  const bool released = p.Release().ok();
  return a.ok() && b.ok() && a.value() == "session-0:/a" && b.value() == "session-0:/b" &&
         id == 0 && fetches == 2 && c.created.load() == 1 && released;
}

bool TestDestructorReturnsBoundObjects() {
  Counters c;
  {
    proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kThread, 2));
    if (!p.SetFactory(SessionFactory(&c)).ok()) return false;
    if (!p.SetPoolHooks(CountingHooks(&c)).ok()) return false;
    if (!p.Get().ok()) return false;
  }
  return c.created.load() == 1 && c.destroyed.load() == 1;
}

bool TestUnpooledFactoryUnknownException() {
  proxy::ProxyOptions options;
  options.use_pool = false;
  proxy::Proxy<ISession> p(options);
  proxy::Proxy<ISession>::Factory throwing = [](std::uint64_t) -> api::Result<ISession*> {
    throw 42;
  };
  if (!p.SetFactory(throwing).ok()) return false;
  api::Result<ISession*> r(api::Status(api::StatusCode::kInternalError, "not called"));
  try {
    r = p.Get();
  } catch (...) {
    return false;
  }
  return r.status().code() == api::StatusCode::kCreationError &&
         HasSymbol(r.status(), "PROXY_CREATE_FAILED") && !p.HasObject();
}

bool TestReleaseContextAfterTaskEnds() {
  Counters c;
  proxy::Proxy<ISession> p(PooledOptions(proxy::Scope::kTask, 1));
  if (!p.SetFactory(SessionFactory(&c)).ok()) return false;

  proxy::ContextKey ended = 0;
  {
    proxy::TaskContext ctx;
    ended = ctx.key();
    if (!p.Get().ok()) return false;
  }
  // The finished task still pins the only capacity token.
  if (p.BoundCount() != 1 || p.pool()->Stats().nusing != 1) return false;
  if (!p.ReleaseContext(ended).ok() || !p.ReleaseContext(ended).ok()) return false;

  proxy::TaskContext next;
  api::Result<ISession*> reused = p.Get(std::chrono::milliseconds(20));
  const bool ok = reused.ok() && c.created.load() == 1 && p.BoundCount() == 1;
  return ok && p.Release().ok() && p.pool()->Stats().nusing == 0;
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"shared_object", TestSharedObject},
      {"both_or_neither_source", TestBothOrNeitherSource},
      {"rebind_after_use", TestRebindAfterUseFails},
      {"fixed_object_rejects_thread_scope", TestFixedObjectRejectsThreadScope},
      {"pool_options_locked", TestPoolOptionsLockedOncePoolExists},
      {"thread_scope_distinct_objects", TestThreadScopeDistinctObjects},
      {"release_then_reacquire", TestReleaseThenReacquire},
      {"task_scope", TestTaskScope},
      {"task_context_across_threads", TestTaskContextAcrossThreads},
      {"shared_scope_with_factory", TestSharedScopeWithFactory},
      {"unpooled_mode", TestUnpooledMode},
      {"scoped_helper", TestScopedHelper},
      {"forward_propagates_creation_error", TestForwardPropagatesCreationError},
      {"interface_delegation", TestInterfaceDelegation},
      {"destructor_returns_bound_objects", TestDestructorReturnsBoundObjects},
      {"unpooled_factory_unknown_exception", TestUnpooledFactoryUnknownException},
      {"release_context_after_task_ends", TestReleaseContextAfterTaskEnds},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
