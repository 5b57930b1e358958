#include "poolkit/proxy/context.hpp"

#include <atomic>

namespace poolkit {
namespace proxy {
namespace {

std::atomic<ContextKey> g_next_thread_key(1);
std::atomic<ContextKey> g_next_task_key(1);

thread_local ContextKey t_thread_key = 0;
thread_local ContextKey t_task_key = 0;

}  // namespace

const char* ScopeName(Scope scope) {
  switch (scope) {
    case Scope::kAuto:
      return "auto";
    case Scope::kShared:
      return "shared";
    case Scope::kThread:
      return "thread";
    case Scope::kTask:
      return "task";
    default:
      return "unknown";
  }
}

ContextKey CurrentThreadKey() {
  if (t_thread_key == 0) t_thread_key = g_next_thread_key.fetch_add(1);
  return t_thread_key;
}

ContextKey CurrentTaskKey() { return t_task_key; }

TaskContext::TaskContext() : key_(NextKey()), previous_(t_task_key) { t_task_key = key_; }

TaskContext::TaskContext(ContextKey key)
    : key_(key == 0 ? NextKey() : key), previous_(t_task_key) {
  t_task_key = key_;
}

TaskContext::~TaskContext() { t_task_key = previous_; }

ContextKey TaskContext::NextKey() { return g_next_task_key.fetch_add(1); }

}  // namespace proxy
}  // namespace poolkit
