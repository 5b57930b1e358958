#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "poolkit/api/export.hpp"
#include "poolkit/json/json_codec.hpp"
#include "poolkit/pool/pool_options.hpp"

namespace poolkit {
namespace pool {

struct PoolCounters {
  std::uint64_t nobjs = 0;       // live objects (available + in use)
  std::uint64_t ncreating = 0;   // creation attempts
  std::uint64_t ncreated = 0;
  std::uint64_t nuses = 0;       // successful acquisitions
  std::uint64_t nkilled = 0;     // in-use objects reclaimed by force
  std::uint64_t nrecycled = 0;   // idle objects reaped
  std::uint64_t nwornout = 0;    // retired after max_use
  std::uint64_t ndestroys = 0;
  std::uint64_t nborrows = 0;    // internal borrows for health checks
  std::uint64_t nreturns = 0;
  std::uint64_t nhealth = 0;
  std::uint64_t bad_health = 0;
  std::uint64_t hk_rounds = 0;
  std::uint64_t hk_errors = 0;
  double hk_time_secs = 0.0;
  std::uint64_t hc_rounds = 0;
  std::uint64_t hc_errors = 0;
};

struct ObjectStats {
  std::uint64_t seq = 0;
  std::uint64_t uses = 0;
  double last_get_secs = -1.0;  // seconds since last acquire, -1 if never
  double last_ret_secs = -1.0;  // seconds since last release, -1 if never
  json::Json descriptor;        // from the describe or trace hook, null otherwise
};

struct PoolStats {
  PoolOptions options;
  std::string started;  // ISO-8601 UTC
  bool bounded = false;
  std::size_t gate_value = 0;
  std::size_t gate_init = 0;
  std::size_t navail = 0;
  std::size_t nusing = 0;
  std::size_t ntodel = 0;
  double running_secs = 0.0;
  double last_hk_secs = -1.0;  // seconds since last housekeeping round, -1 if none
  std::chrono::milliseconds housekeeping_interval{0};
  bool housekeeper_running = false;
  bool shutdown = false;
  std::vector<ObjectStats> available;
  std::vector<ObjectStats> in_use;
  PoolCounters counters;
};

POOLKIT_API json::Json ToJson(const PoolStats& stats);

}  // namespace pool
}  // namespace poolkit
