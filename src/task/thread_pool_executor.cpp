#include "task/thread_pool_executor.hpp"

#include <chrono>
#include <exception>

#include "poolkit/api/version.hpp"
#include "poolkit/log/log_manager.hpp"

namespace poolkit {
namespace task {

#define PK_STATUS(code, message) api::Status::FromModule((code), (message), api::ErrorModule::kTask)

ThreadPoolExecutor::ThreadPoolExecutor(std::size_t worker_count)
    : stopping_(false), active_workers_(0), next_task_id_(1), max_retained_states_(4096) {
  options_.worker_count = NormalizeWorkerCount(worker_count);
  workers_.reserve(options_.worker_count);
  for (std::size_t i = 0; i < options_.worker_count; ++i) {
    workers_.push_back(std::thread(&ThreadPoolExecutor::WorkerLoop, this));
  }
}

ThreadPoolExecutor::ThreadPoolExecutor(const ExecutorOptions& options)
    : ThreadPoolExecutor(options.worker_count) {
  std::lock_guard<std::mutex> lock(mu_);
  options_.queue_capacity = options.queue_capacity;
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    if (workers_[i].joinable()) workers_[i].join();
  }
}

const char* ThreadPoolExecutor::Name() const { return "poolkit.task.thread_pool_executor"; }
std::uint32_t ThreadPoolExecutor::ApiVersion() const { return api::kApiVersion; }
void ThreadPoolExecutor::Release() { delete this; }

std::size_t ThreadPoolExecutor::NormalizeWorkerCount(std::size_t worker_count) const {
  if (worker_count > 0) return worker_count;
  std::size_t count = static_cast<std::size_t>(std::thread::hardware_concurrency());
  return count == 0 ? 1 : count;
}

api::Status ThreadPoolExecutor::Submit(void (*fn)(void*), void* user_data) {
  api::Result<TaskId> r = SubmitEx(fn, user_data);
  return r.ok() ? api::Status::Ok() : r.status();
}

api::Result<TaskId> ThreadPoolExecutor::SubmitEx(void (*fn)(void*), void* user_data) {
  if (fn == NULL) {
    return api::Result<TaskId>(PK_STATUS(api::StatusCode::kInvalidArgument, "fn is null"));
  }

  TaskId id = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) {
      return api::Result<TaskId>(
          PK_STATUS(api::StatusCode::kShuttingDown, "executor is stopping"));
    }
    if (options_.queue_capacity > 0 && tasks_.size() >= options_.queue_capacity) {
      ++stats_.rejected;
      return api::Result<TaskId>(api::Status::FromModule(
          api::StatusCode::kWouldBlock, "executor queue is full", api::ErrorModule::kTask,
          api::detail_id::kTaskQueueFull));
    }
    id = next_task_id_++;
    states_[id] = std::make_shared<TaskState>();
    TaskEntry entry;
    entry.id = id;
    entry.fn = fn;
    entry.user_data = user_data;
    tasks_.push_back(entry);
    ++stats_.submitted;
    stats_.queue_depth = tasks_.size();
    if (stats_.queue_depth > stats_.queue_high_watermark) {
      stats_.queue_high_watermark = stats_.queue_depth;
    }
  }
  cv_.notify_one();
  return api::Result<TaskId>(id);
}

api::Status ThreadPoolExecutor::Wait(TaskId id, std::uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mu_);
  std::unordered_map<TaskId, std::shared_ptr<TaskState> >::iterator it = states_.find(id);
  if (it == states_.end()) return PK_STATUS(api::StatusCode::kNotFound, "task id not found");
  std::shared_ptr<TaskState> state = it->second;

  if (timeout_ms == 0) {
    state->cv.wait(lock, [state]() { return state->done; });
    return api::Status::Ok();
  }
  const bool done = state->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                       [state]() { return state->done; });
  return done ? api::Status::Ok() : PK_STATUS(api::StatusCode::kWouldBlock, "wait timeout");
}

api::Status ThreadPoolExecutor::WaitAll() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_cv_.wait(lock, [this]() { return tasks_.empty() && active_workers_ == 0; });
  return api::Status::Ok();
}

api::Result<ExecutorStats> ThreadPoolExecutor::QueryStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  ExecutorStats out = stats_;
  out.queue_depth = tasks_.size();
  return api::Result<ExecutorStats>(out);
}

void ThreadPoolExecutor::MarkTaskDone(TaskId id, bool failed) {
  std::lock_guard<std::mutex> lock(mu_);
  if (failed) {
    ++stats_.failed;
  } else {
    ++stats_.completed;
  }
  std::unordered_map<TaskId, std::shared_ptr<TaskState> >::iterator it = states_.find(id);
  if (it == states_.end()) return;
  it->second->done = true;
  it->second->cv.notify_all();

  // Finished states are kept for a while so late Wait calls still succeed.
  done_ids_.push_back(id);
  while (done_ids_.size() > max_retained_states_) {
    states_.erase(done_ids_.front());
    done_ids_.pop_front();
  }
}

void ThreadPoolExecutor::WorkerLoop() {
  for (;;) {
    TaskEntry task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
      if (stopping_ && tasks_.empty()) return;
      task = tasks_.front();
      tasks_.pop_front();
      ++active_workers_;
    }

    bool failed = false;
    try {
      task.fn(task.user_data);
    } catch (const std::exception& ex) {
      failed = true;
      log::LogManager::Log(log::LogSeverity::kError,
                           std::string("executor task failed: ") + ex.what());
    } catch (...) {
      failed = true;
      log::LogManager::Log(log::LogSeverity::kError, "executor task failed: unknown exception");
    }
    MarkTaskDone(task.id, failed);

    {
      std::lock_guard<std::mutex> lock(mu_);
      --active_workers_;
      stats_.queue_depth = tasks_.size();
      idle_cv_.notify_all();
    }
  }
}

#undef PK_STATUS

}  // namespace task
}  // namespace poolkit
