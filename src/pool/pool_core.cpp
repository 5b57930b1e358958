#include "poolkit/pool/pool_core.hpp"

#include <ctime>
#include <exception>
#include <sstream>

#include "poolkit/log/log_manager.hpp"
#include "pool/capacity_gate.hpp"
#include "task/thread_pool_executor.hpp"

namespace poolkit {
namespace pool {
namespace {

#define PK_POOL_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kPool, (detail))

double SecondsBetween(std::chrono::steady_clock::time_point from,
                      std::chrono::steady_clock::time_point to) {
  return std::chrono::duration_cast<std::chrono::duration<double> >(to - from).count();
}

std::string IsoTime(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf);
}

void Warn(const std::string& message) { log::LogManager::Log(log::LogSeverity::kWarning, message); }
void Error(const std::string& message) { log::LogManager::Log(log::LogSeverity::kError, message); }

}  // namespace

PoolCore::PoolCore(const PoolOptions& options, const ErasedHooks& hooks,
                   task::IExecutor* executor)
    : options_(NormalizePoolOptions(options)),
      hooks_(hooks),
      next_seq_(0),
      creating_(0),
      min_size_(options.min_size),
      started_(false),
      shutdown_(false),
      hk_ran_(false),
      interval_(0),
      hk_stop_(false),
      hk_exited_(false),
      executor_(executor),
      owns_executor_(false),
      scheduled_(false),
      inflight_(0) {
  if (options_.max_size > 0) gate_.reset(new CapacityGate(options_.max_size));
  if (executor_ == NULL) {
    executor_ = new task::ThreadPoolExecutor(1);
    owns_executor_ = true;
  }
}

PoolCore::~PoolCore() {
  Shutdown();
  Flush();
  if (owns_executor_) executor_->Release();
}

api::Status PoolCore::Start() {
  api::Status st = ValidatePoolOptions(options_);
  if (!st.ok()) return st;
  if (!hooks_.create || !hooks_.dispose) {
    return PK_POOL_STATUS(api::StatusCode::kInvalidConfiguration,
                          "pool '" + options_.name + "': create and dispose hooks are required",
                          api::detail_id::kPoolInvalidOptions);
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) {
      return PK_POOL_STATUS(api::StatusCode::kShuttingDown,
                            "pool '" + options_.name + "' is shut down",
                            api::detail_id::kPoolShuttingDown);
    }
    if (started_) return api::Status::Ok();
    started_ = true;
    started_at_ = Clock::now();
    started_wall_ = std::chrono::system_clock::now();
  }

  if (options_.max_borrow_kill.count() > 0 && options_.max_borrow_warn > options_.max_borrow_kill) {
    std::ostringstream msg;
    msg << "pool '" << options_.name << "': max_borrow_warn " << options_.max_borrow_warn.count()
        << " ms exceeds max_borrow_kill " << options_.max_borrow_kill.count() << " ms";
    Warn(msg.str());
  }

  interval_ = ResolveHousekeepingInterval(options_, static_cast<bool>(hooks_.is_healthy));
  if (interval_.count() > 0 && options_.housekeeper_thread) {
    housekeeper_ = std::thread(&PoolCore::HousekeeperLoop, this);
  }

  std::lock_guard<std::mutex> lock(maintenance_mu_);
  Fill();
  return api::Status::Ok();
}

api::Result<void*> PoolCore::Acquire(std::chrono::milliseconds timeout) {
  if (timeout.count() < 0) timeout = options_.acquire_timeout;
  if (IsShutdown()) {
    return api::Result<void*>(PK_POOL_STATUS(api::StatusCode::kShuttingDown,
                                             "pool '" + options_.name + "' is shut down",
                                             api::detail_id::kPoolShuttingDown));
  }

  if (gate_) {
    if (timeout.count() == 0) {
      gate_->AcquireBlocking();
    } else if (!gate_->TryAcquireFor(timeout)) {
      std::ostringstream msg;
      msg << "pool '" << options_.name << "' acquire timed out after " << timeout.count()
          << " ms";
      return api::Result<void*>(PK_POOL_STATUS(api::StatusCode::kTimeout, msg.str(),
                                               api::detail_id::kPoolAcquireTimeout));
    }
    if (log::LogManager::VerboseEnabled(2)) {
      log::LogManager::Verbose(2, "pool '" + options_.name + "': token acquired");
    }
  }

  void* obj = NULL;
  bool closed = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) {
      closed = true;
    } else if (!available_.empty()) {
      obj = *available_.begin();
      available_.erase(available_.begin());
      MarkAcquiredLocked(obj);
    } else {
      ++creating_;
    }
  }
  if (closed) {
    ReleaseToken("acquire after shutdown");
    return api::Result<void*>(PK_POOL_STATUS(api::StatusCode::kShuttingDown,
                                             "pool '" + options_.name + "' is shut down",
                                             api::detail_id::kPoolShuttingDown));
  }

  if (obj == NULL) {
    std::uint64_t seq = 0;
    api::Result<void*> created = CreateObject(&seq);
    if (!created.ok()) {
      ReleaseToken("creation failure");
      return created;
    }
    obj = created.value();
    bool late = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      --creating_;
      if (shutdown_) {
        late = true;
        ++counters_.ncreated;
      } else {
        RegisterLocked(obj, seq);
        MarkAcquiredLocked(obj);
      }
    }
    if (late) {
      Destroy(obj);
      ReleaseToken("creation after shutdown");
      return api::Result<void*>(PK_POOL_STATUS(api::StatusCode::kShuttingDown,
                                               "pool '" + options_.name + "' is shut down",
                                               api::detail_id::kPoolShuttingDown));
    }
  }

  RunHook("on_acquire", hooks_.on_acquire, obj);
  return api::Result<void*>(obj);
}

void PoolCore::Release(void* obj) {
  if (obj == NULL) return;
  bool reclaimed = false;
  bool dispose_now = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    std::unordered_map<void*, bool>::iterator condemned = condemned_.find(obj);
    if (condemned != condemned_.end()) {
      reclaimed = true;
      dispose_now = condemned->second;
      condemned_.erase(condemned);
    } else {
      std::unordered_map<void*, ObjectInfo>::iterator info = info_.find(obj);
      // Not borrowed, or another Release of the same borrow is already running.
      if (in_use_.find(obj) == in_use_.end() || info == info_.end() || info->second.releasing) {
        if (log::LogManager::VerboseEnabled(1)) {
          log::LogManager::Verbose(1, "pool '" + options_.name +
                                          "': ignoring release of an object not in use");
        }
        return;
      }
      info->second.releasing = true;
    }
  }

  if (reclaimed) {
    // The borrower lost the object to a forced reclaim; its token is already back.
    if (log::LogManager::VerboseEnabled(1)) {
      log::LogManager::Verbose(1, "pool '" + options_.name +
                                      "': late release of a reclaimed object");
    }
    if (dispose_now) Dispose(obj);
    return;
  }

  RunHook("on_release", hooks_.on_release, obj);

  bool returned = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (in_use_.erase(obj) == 1) {
      returned = true;
      ObjectInfo& info = info_[obj];
      info.releasing = false;
      info.last_released = Clock::now();
      info.released = true;
      if (shutdown_ || (options_.max_use > 0 && info.uses >= options_.max_use)) {
        if (!shutdown_) ++counters_.nwornout;
        info_.erase(obj);
        --counters_.nobjs;
        pending_.push_back(obj);
      } else {
        available_.insert(obj);
      }
    }
  }
  if (!returned) return;
  ReleaseToken("release");
  ScheduleMaintenance();
}

void PoolCore::Shutdown(std::chrono::milliseconds join_timeout) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) return;
    shutdown_ = true;
    min_size_ = 0;
  }

  if (housekeeper_.joinable()) {
    std::unique_lock<std::mutex> lock(hk_mu_);
    hk_stop_ = true;
    hk_cv_.notify_all();
    if (!hk_cv_.wait_for(lock, join_timeout, [this]() { return hk_exited_; })) {
      Warn("pool '" + options_.name + "': shutting down with a live housekeeper, waiting for it");
    }
    lock.unlock();
    housekeeper_.join();
  }

  Flush();

  std::vector<void*> victims;
  std::size_t borrowed = 0;
  {
    std::lock_guard<std::mutex> lock(maintenance_mu_);
    std::lock_guard<std::mutex> guard(mu_);
    for (std::unordered_set<void*>::iterator it = in_use_.begin(); it != in_use_.end();) {
      // Objects inside on_release are finished off by Release itself.
      if (info_[*it].releasing) {
        ++it;
        continue;
      }
      victims.push_back(*it);
      info_.erase(*it);
      it = in_use_.erase(it);
      ++borrowed;
    }
    for (std::unordered_set<void*>::iterator it = available_.begin(); it != available_.end();
         ++it) {
      victims.push_back(*it);
      info_.erase(*it);
    }
    available_.clear();
    victims.insert(victims.end(), pending_.begin(), pending_.end());
    counters_.nobjs -= victims.size() - pending_.size();
    pending_.clear();
  }

  if (borrowed > 0) {
    std::ostringstream msg;
    msg << "pool '" << options_.name << "': shutdown destroys " << borrowed
        << " objects still in use";
    Warn(msg.str());
  }
  for (std::size_t i = 0; i < borrowed; ++i) ReleaseToken("shutdown");
  for (std::size_t i = 0; i < victims.size(); ++i) Destroy(victims[i]);

  std::unordered_map<void*, bool> condemned;
  {
    std::lock_guard<std::mutex> lock(mu_);
    condemned.swap(condemned_);
  }
  if (!condemned.empty()) {
    std::ostringstream msg;
    msg << "pool '" << options_.name << "': shutdown frees " << condemned.size()
        << " reclaimed objects never released by their borrowers";
    Warn(msg.str());
  }
  for (std::unordered_map<void*, bool>::iterator it = condemned.begin(); it != condemned.end();
       ++it) {
    if (!it->second) {
      RunHook("on_destroy", hooks_.on_destroy, it->first);
      std::lock_guard<std::mutex> lock(mu_);
      ++counters_.ndestroys;
    }
    Dispose(it->first);
  }
}

void PoolCore::Flush() {
  std::unique_lock<std::mutex> lock(sched_mu_);
  sched_cv_.wait(lock, [this]() { return inflight_ == 0; });
}

void PoolCore::RunHousekeepingOnce() {
  if (IsShutdown()) return;
  std::lock_guard<std::mutex> lock(maintenance_mu_);
  const Clock::time_point start = Clock::now();
  bool health_round = false;
  {
    std::lock_guard<std::mutex> guard(mu_);
    health_round = static_cast<bool>(hooks_.is_healthy) &&
                   counters_.hk_rounds % options_.health_check_period == 0;
  }

  try {
    KillSweep();
    IdleSweep();
    if (health_round) HealthSweep();
    Drain();
    Fill();
  } catch (const std::exception& ex) {
    std::lock_guard<std::mutex> guard(mu_);
    ++counters_.hk_errors;
    Error("pool '" + options_.name + "': housekeeper round error: " + ex.what());
  } catch (...) {
    std::lock_guard<std::mutex> guard(mu_);
    ++counters_.hk_errors;
    Error("pool '" + options_.name + "': housekeeper round error: unknown exception");
  }

  const Clock::time_point end = Clock::now();
  std::lock_guard<std::mutex> guard(mu_);
  ++counters_.hk_rounds;
  counters_.hk_time_secs += SecondsBetween(start, end);
  last_hk_ = end;
  hk_ran_ = true;
}

PoolStats PoolCore::Stats() const {
  PoolStats out;
  out.options = options_;
  out.housekeeping_interval = interval_;
  out.bounded = static_cast<bool>(gate_);
  if (gate_) {
    out.gate_value = gate_->Available();
    out.gate_init = gate_->Capacity();
  }

  std::lock_guard<std::mutex> lock(mu_);
  const Clock::time_point now = Clock::now();
  out.options.min_size = min_size_;
  out.started = started_ ? IsoTime(started_wall_) : std::string();
  out.navail = available_.size();
  out.nusing = in_use_.size();
  out.ntodel = pending_.size();
  out.running_secs = started_ ? SecondsBetween(started_at_, now) : 0.0;
  out.last_hk_secs = hk_ran_ ? SecondsBetween(last_hk_, now) : -1.0;
  out.housekeeper_running = housekeeper_.joinable() && !shutdown_;
  out.shutdown = shutdown_;
  out.counters = counters_;
  for (std::unordered_set<void*>::const_iterator it = available_.begin(); it != available_.end();
       ++it) {
    out.available.push_back(DescribeLocked(*it, info_.at(*it), now));
  }
  for (std::unordered_set<void*>::const_iterator it = in_use_.begin(); it != in_use_.end(); ++it) {
    out.in_use.push_back(DescribeLocked(*it, info_.at(*it), now));
  }
  return out;
}

bool PoolCore::IsShutdown() const {
  std::lock_guard<std::mutex> lock(mu_);
  return shutdown_;
}

// Caller has already incremented creating_. On success the caller decrements it
// and registers the object in the same critical section that places it.
api::Result<void*> PoolCore::CreateObject(std::uint64_t* seq) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    *seq = next_seq_++;
    ++counters_.ncreating;
  }

  api::Result<void*> created(PK_POOL_STATUS(api::StatusCode::kCreationError,
                                            "pool '" + options_.name + "': create returned nothing",
                                            api::detail_id::kPoolCreateFailed));
  try {
    created = hooks_.create(*seq);
  } catch (const std::exception& ex) {
    created = api::Result<void*>(PK_POOL_STATUS(
        api::StatusCode::kCreationError,
        "pool '" + options_.name + "': create failed: " + ex.what(),
        api::detail_id::kPoolCreateFailed));
  } catch (...) {
    created = api::Result<void*>(PK_POOL_STATUS(
        api::StatusCode::kCreationError,
        "pool '" + options_.name + "': create failed: unknown exception",
        api::detail_id::kPoolCreateFailed));
  }

  if (created.ok() && created.value() == NULL) {
    created = api::Result<void*>(PK_POOL_STATUS(
        api::StatusCode::kCreationError,
        "pool '" + options_.name + "': create returned a null object",
        api::detail_id::kPoolCreateFailed));
  } else if (!created.ok() && created.status().code() != api::StatusCode::kCreationError) {
    created = api::Result<void*>(PK_POOL_STATUS(
        api::StatusCode::kCreationError,
        "pool '" + options_.name + "': create failed: " + created.status().message(),
        api::detail_id::kPoolCreateFailed));
  }

  if (!created.ok()) {
    std::lock_guard<std::mutex> lock(mu_);
    --creating_;
    Error(created.status().ToString());
    return created;
  }

  RunHook("on_create", hooks_.on_create, created.value());
  return created;
}

void PoolCore::RegisterLocked(void* obj, std::uint64_t seq) {
  ObjectInfo info;
  info.seq = seq;
  // Fresh objects age as idle from creation.
  info.last_released = Clock::now();
  info_[obj] = info;
  ++counters_.ncreated;
  ++counters_.nobjs;
}

// Stamped together with the move into in_use so the kill sweep never sees a stale time.
void PoolCore::MarkAcquiredLocked(void* obj) {
  in_use_.insert(obj);
  ObjectInfo& info = info_[obj];
  ++info.uses;
  info.last_acquired = Clock::now();
  info.acquired = true;
  ++counters_.nuses;
}

void PoolCore::Destroy(void* obj) {
  RunHook("on_destroy", hooks_.on_destroy, obj);
  bool keep = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++counters_.ndestroys;
    std::unordered_map<void*, bool>::iterator it = condemned_.find(obj);
    if (it != condemned_.end()) {
      it->second = true;
      keep = true;
    }
  }
  // A reclaimed object's memory outlives its borrower's pointer; the late Release frees it.
  if (!keep) Dispose(obj);
}

void PoolCore::Dispose(void* obj) {
  try {
    hooks_.dispose(obj);
  } catch (const std::exception& ex) {
    Error("pool '" + options_.name + "': dispose failed: " + ex.what());
  } catch (...) {
    Error("pool '" + options_.name + "': dispose failed: unknown exception");
  }
}

void PoolCore::RunHook(const char* name, const std::function<void(void*)>& hook, void* obj) {
  if (!hook) return;
  try {
    hook(obj);
  } catch (const std::exception& ex) {
    Error("pool '" + options_.name + "': " + name + " hook failed: " + ex.what());
  } catch (...) {
    Error("pool '" + options_.name + "': " + name + " hook failed: unknown exception");
  }
}

// An exception from the health hook counts as unhealthy.
bool PoolCore::CheckHealth(void* obj) {
  bool healthy = false;
  bool errored = false;
  std::string reason;
  try {
    healthy = hooks_.is_healthy(obj);
  } catch (const std::exception& ex) {
    errored = true;
    reason = ex.what();
  } catch (...) {
    errored = true;
    reason = "unknown exception";
  }

  std::lock_guard<std::mutex> lock(mu_);
  ++counters_.nhealth;
  if (errored) {
    ++counters_.hc_errors;
    Error("pool '" + options_.name + "': health check error: " + reason);
  }
  if (!healthy) {
    ++counters_.bad_health;
    std::ostringstream msg;
    msg << "pool '" << options_.name << "': bad health for object #" << info_[obj].seq;
    Error(msg.str());
  }
  return healthy;
}

void PoolCore::ReleaseToken(const char* where) {
  if (!gate_) return;
  if (!gate_->Release()) {
    Error("pool '" + options_.name + "': capacity token over-released on " + where);
  } else if (log::LogManager::VerboseEnabled(2)) {
    log::LogManager::Verbose(2, "pool '" + options_.name + "': token released on " + where);
  }
}

void PoolCore::KillSweep() {
  if (options_.max_borrow_warn.count() == 0 && options_.max_borrow_kill.count() == 0) return;

  std::size_t long_run = 0;
  std::size_t killed = 0;
  double long_time = 0.0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const Clock::time_point now = Clock::now();
    for (std::unordered_set<void*>::iterator it = in_use_.begin(); it != in_use_.end();) {
      const ObjectInfo& info = info_[*it];
      if (info.releasing) {
        ++it;
        continue;
      }
      const Clock::duration held = now - info.last_acquired;
      if (options_.max_borrow_warn.count() > 0 && held >= options_.max_borrow_warn) {
        ++long_run;
        long_time += SecondsBetween(info.last_acquired, now);
      }
      if (options_.max_borrow_kill.count() > 0 && held >= options_.max_borrow_kill) {
        ++killed;
        ++counters_.nkilled;
        --counters_.nobjs;
        condemned_[*it] = false;
        pending_.push_back(*it);
        info_.erase(*it);
        it = in_use_.erase(it);
      } else {
        ++it;
      }
    }
  }

  // Reclaimed objects no longer hold their borrower's token.
  for (std::size_t i = 0; i < killed; ++i) ReleaseToken("forced reclaim");
  if (long_run > 0 || killed > 0) {
    std::ostringstream msg;
    msg << "pool '" << options_.name << "': long running objects: " << long_run << " ("
        << (long_run > 0 ? long_time / static_cast<double>(long_run) : 0.0) << " seconds, "
        << killed << " to kill)";
    Warn(msg.str());
  }
}

void PoolCore::IdleSweep() {
  if (options_.max_idle_age.count() == 0) return;
  std::lock_guard<std::mutex> lock(mu_);
  const Clock::time_point now = Clock::now();
  for (std::unordered_set<void*>::iterator it = available_.begin();
       it != available_.end() && available_.size() > min_size_;) {
    if (now - info_[*it].last_released >= options_.max_idle_age) {
      ++counters_.nrecycled;
      --counters_.nobjs;
      pending_.push_back(*it);
      info_.erase(*it);
      it = available_.erase(it);
    } else {
      ++it;
    }
  }
}

// Runs outside the bookkeeping lock so a stuck check cannot freeze the pool.
void PoolCore::HealthSweep() {
  std::vector<void*> candidates;
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++counters_.hc_rounds;
    candidates.assign(available_.begin(), available_.end());
  }

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    void* obj = candidates[i];
    if (gate_ && !gate_->TryAcquire()) break;
    bool borrowed = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (available_.erase(obj) > 0) {
        in_use_.insert(obj);
        ++counters_.nborrows;
        borrowed = true;
      }
    }
    if (!borrowed) {
      ReleaseToken("health skip");
      continue;
    }

    const bool healthy = CheckHealth(obj);
    {
      std::lock_guard<std::mutex> lock(mu_);
      in_use_.erase(obj);
      ++counters_.nreturns;
      if (healthy) {
        available_.insert(obj);
      } else {
        --counters_.nobjs;
        info_.erase(obj);
        pending_.push_back(obj);
      }
    }
    ReleaseToken("health return");
  }
}

void PoolCore::Drain() {
  std::vector<void*> doomed;
  {
    std::lock_guard<std::mutex> lock(mu_);
    doomed.swap(pending_);
  }
  if (!doomed.empty() && log::LogManager::VerboseEnabled(1)) {
    std::ostringstream msg;
    msg << "pool '" << options_.name << "': destroying " << doomed.size() << " objects";
    log::LogManager::Verbose(1, msg.str());
  }
  for (std::size_t i = 0; i < doomed.size(); ++i) Destroy(doomed[i]);
}

// Tops up to min_size available objects. Failures are logged and skipped.
void PoolCore::Fill() {
  std::size_t tocreate = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_ || available_.size() >= min_size_) return;
    tocreate = min_size_ - available_.size();
  }

  for (std::size_t i = 0; i < tocreate; ++i) {
    if (gate_ && !gate_->TryAcquire()) {
      if (log::LogManager::VerboseEnabled(2)) {
        log::LogManager::Verbose(2, "pool '" + options_.name + "': fill skipped, no token");
      }
      break;
    }
    bool go = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      const bool room = options_.max_size == 0 ||
                        counters_.nobjs + creating_ < options_.max_size;
      go = !shutdown_ && available_.size() < min_size_ && room;
      if (go) ++creating_;
    }
    if (!go) {
      ReleaseToken("fill");
      break;
    }

    std::uint64_t seq = 0;
    api::Result<void*> created = CreateObject(&seq);
    if (created.ok()) {
      bool late = false;
      {
        std::lock_guard<std::mutex> lock(mu_);
        --creating_;
        if (shutdown_) {
          late = true;
          ++counters_.ncreated;
        } else {
          RegisterLocked(created.value(), seq);
          available_.insert(created.value());
        }
      }
      if (late) Destroy(created.value());
    }
    ReleaseToken("fill");
  }
}

void PoolCore::ScheduleMaintenance() {
  {
    std::lock_guard<std::mutex> lock(sched_mu_);
    if (scheduled_) return;
    scheduled_ = true;
    ++inflight_;
  }
  api::Status st = executor_->Submit(&PoolCore::MaintenanceTask, this);
  if (!st.ok()) {
    if (log::LogManager::VerboseEnabled(1)) {
      log::LogManager::Verbose(1, "pool '" + options_.name +
                                      "': maintenance runs inline: " + st.ToString());
    }
    RunMaintenance();
  }
}

void PoolCore::MaintenanceTask(void* self) { static_cast<PoolCore*>(self)->RunMaintenance(); }

void PoolCore::RunMaintenance() {
  {
    std::lock_guard<std::mutex> lock(sched_mu_);
    scheduled_ = false;
  }
  try {
    std::lock_guard<std::mutex> lock(maintenance_mu_);
    Drain();
    Fill();
  } catch (const std::exception& ex) {
    Error("pool '" + options_.name + "': maintenance error: " + ex.what());
  } catch (...) {
    Error("pool '" + options_.name + "': maintenance error: unknown exception");
  }
  std::lock_guard<std::mutex> lock(sched_mu_);
  --inflight_;
  sched_cv_.notify_all();
}

void PoolCore::HousekeeperLoop() {
  {
    std::ostringstream msg;
    msg << "pool '" << options_.name << "': housekeeper running every " << interval_.count()
        << " ms";
    log::LogManager::Log(log::LogSeverity::kInfo, msg.str());
  }
  std::unique_lock<std::mutex> lock(hk_mu_);
  while (!hk_stop_) {
    if (hk_cv_.wait_for(lock, interval_, [this]() { return hk_stop_; })) break;
    lock.unlock();
    RunHousekeepingOnce();
    lock.lock();
  }
  hk_exited_ = true;
  hk_cv_.notify_all();
}

ObjectStats PoolCore::DescribeLocked(void* obj, const ObjectInfo& info,
                                     Clock::time_point now) const {
  ObjectStats out;
  out.seq = info.seq;
  out.uses = info.uses;
  out.last_get_secs = info.acquired ? SecondsBetween(info.last_acquired, now) : -1.0;
  out.last_ret_secs = info.released ? SecondsBetween(info.last_released, now) : -1.0;
  try {
    if (hooks_.describe) {
      out.descriptor = hooks_.describe(obj);
    } else if (hooks_.trace) {
      out.descriptor = hooks_.trace(obj);
    }
  } catch (const std::exception& ex) {
    Error("pool '" + options_.name + "': describe hook failed: " + ex.what());
  } catch (...) {
    Error("pool '" + options_.name + "': describe hook failed: unknown exception");
  }
  return out;
}

#undef PK_POOL_STATUS

}  // namespace pool
}  // namespace poolkit
