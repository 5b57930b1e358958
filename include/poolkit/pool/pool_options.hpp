#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"
#include "poolkit/json/json_codec.hpp"

namespace poolkit {
namespace pool {

// Pool configuration. Immutable once the pool is started.
// Zero durations and counts disable the corresponding policy.
struct PoolOptions {
  std::string name = "pool";
  std::size_t max_size = 0;  // 0 means unbounded
  std::size_t min_size = 1;  // warm objects kept available
  std::size_t max_use = 0;   // retire after this many acquisitions
  std::chrono::milliseconds max_idle_age{0};
  std::chrono::milliseconds max_borrow_warn{0};  // defaults to max_borrow_kill
  std::chrono::milliseconds max_borrow_kill{0};
  std::size_t health_check_period = 1;  // in housekeeping rounds
  std::chrono::milliseconds housekeeping_interval{0};  // 0 means derived
  std::chrono::milliseconds acquire_timeout{0};        // 0 means wait forever
  // Tests turn this off and drive RunHousekeepingOnce() by hand.
  bool housekeeper_thread = true;
};

// Rejects min_size > max_size on a bounded pool and a zero health period.
POOLKIT_API api::Status ValidatePoolOptions(const PoolOptions& options);

// Reads options from the root object or its "pool" member. Keys that are absent keep
// their defaults; keys of the wrong JSON type yield kInvalidArgument.
POOLKIT_API api::Result<PoolOptions> LoadPoolOptions(const json::Json& doc);
POOLKIT_API api::Result<PoolOptions> LoadPoolOptionsFromFile(const std::string& path);

// Explicit interval, else half the smaller non-zero of idle age and borrow warn,
// else 60 s with a health hook, else zero (no housekeeping thread).
POOLKIT_API std::chrono::milliseconds ResolveHousekeepingInterval(const PoolOptions& options,
                                                                  bool has_health_hook);

// Fills in max_borrow_warn from max_borrow_kill when only the latter is set.
POOLKIT_API PoolOptions NormalizePoolOptions(const PoolOptions& options);

POOLKIT_API json::Json ToJson(const PoolOptions& options);

}  // namespace pool
}  // namespace poolkit
