#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "poolkit/task/iexecutor.hpp"

namespace poolkit {
namespace task {

class ThreadPoolExecutor : public IExecutor {
 public:
  explicit ThreadPoolExecutor(std::size_t worker_count = 0);
  explicit ThreadPoolExecutor(const ExecutorOptions& options);
  ~ThreadPoolExecutor() override;

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  api::Status Submit(void (*fn)(void*), void* user_data) override;
  api::Result<TaskId> SubmitEx(void (*fn)(void*), void* user_data) override;
  api::Status Wait(TaskId id, std::uint32_t timeout_ms) override;
  api::Status WaitAll() override;
  api::Result<ExecutorStats> QueryStats() const override;

 private:
  struct TaskState {
    bool done = false;
    std::condition_variable cv;
  };

  struct TaskEntry {
    TaskId id = 0;
    void (*fn)(void*) = NULL;
    void* user_data = NULL;
  };

  std::size_t NormalizeWorkerCount(std::size_t worker_count) const;
  void MarkTaskDone(TaskId id, bool failed);
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::deque<TaskEntry> tasks_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  bool stopping_;
  std::size_t active_workers_;
  TaskId next_task_id_;
  std::size_t max_retained_states_;
  ExecutorStats stats_;
  ExecutorOptions options_;
  std::unordered_map<TaskId, std::shared_ptr<TaskState> > states_;
  std::deque<TaskId> done_ids_;
};

}  // namespace task
}  // namespace poolkit
