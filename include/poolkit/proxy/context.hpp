#pragma once

#include <cstdint>

#include "poolkit/api/export.hpp"

namespace poolkit {
namespace proxy {

// Sharing granularity of a proxied object.
enum class Scope {
  kAuto = 0,  // kShared for a fixed object, kThread for a factory
  kShared,    // one object for every caller
  kThread,    // one object per thread
  kTask       // one object per TaskContext
};

POOLKIT_API const char* ScopeName(Scope scope);

typedef std::uint64_t ContextKey;

// Key reserved for the shared slot.
static const ContextKey kSharedContextKey = 0;

// Stable non-zero key of the calling thread.
POOLKIT_API ContextKey CurrentThreadKey();

// Key of the innermost TaskContext on the calling thread, 0 when there is none.
POOLKIT_API ContextKey CurrentTaskKey();

// Marks a unit of work (for instance one request) on the current thread. Nested
// contexts restore the outer key when they end. Must be destroyed on the thread
// that created it.
//
// Ending a context does not touch proxies: an object a task-scoped Proxy bound to
// key() stays borrowed until Proxy::Release inside the context or
// Proxy::ReleaseContext(key()) afterwards. Until then it holds a capacity token.
class POOLKIT_API TaskContext {
 public:
  TaskContext();
  // Reuses a caller-supplied key, e.g. to resume a task on another thread. Must be non-zero.
  explicit TaskContext(ContextKey key);
  ~TaskContext();

  TaskContext(const TaskContext&) = delete;
  TaskContext& operator=(const TaskContext&) = delete;

  ContextKey key() const { return key_; }

  // Fresh task key, never 0 and never repeated in the process.
  static ContextKey NextKey();

 private:
  ContextKey key_;
  ContextKey previous_;
};

}  // namespace proxy
}  // namespace poolkit
