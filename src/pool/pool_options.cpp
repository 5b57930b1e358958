#include "poolkit/pool/pool_options.hpp"

#include <algorithm>
#include <cstdint>

namespace poolkit {
namespace pool {
namespace {

#define PK_POOL_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kPool, (detail))

api::Status WrongType(const char* key, const char* expected) {
  return PK_POOL_STATUS(api::StatusCode::kInvalidArgument,
                        std::string("pool option '") + key + "' must be " + expected,
                        api::detail_id::kPoolInvalidOptions);
}

api::Status ReadCount(const json::Json& node, const char* key, std::size_t* out) {
  json::Json::const_iterator it = node.find(key);
  if (it == node.end()) return api::Status::Ok();
  if (!it->is_number_unsigned()) return WrongType(key, "a non-negative integer");
  *out = it->get<std::size_t>();
  return api::Status::Ok();
}

api::Status ReadMillis(const json::Json& node, const char* key, std::chrono::milliseconds* out) {
  json::Json::const_iterator it = node.find(key);
  if (it == node.end()) return api::Status::Ok();
  if (!it->is_number_unsigned()) return WrongType(key, "a non-negative integer");
  *out = std::chrono::milliseconds(it->get<std::int64_t>());
  return api::Status::Ok();
}

}  // namespace

api::Status ValidatePoolOptions(const PoolOptions& options) {
  if (options.max_size > 0 && options.min_size > options.max_size) {
    return PK_POOL_STATUS(api::StatusCode::kInvalidConfiguration,
                          "pool '" + options.name + "': min_size exceeds max_size",
                          api::detail_id::kPoolInvalidOptions);
  }
  if (options.health_check_period == 0) {
    return PK_POOL_STATUS(api::StatusCode::kInvalidConfiguration,
                          "pool '" + options.name + "': health_check_period must be positive",
                          api::detail_id::kPoolInvalidOptions);
  }
  if (options.max_idle_age.count() < 0 || options.max_borrow_warn.count() < 0 ||
      options.max_borrow_kill.count() < 0 || options.housekeeping_interval.count() < 0 ||
      options.acquire_timeout.count() < 0) {
    return PK_POOL_STATUS(api::StatusCode::kInvalidConfiguration,
                          "pool '" + options.name + "': durations must not be negative",
                          api::detail_id::kPoolInvalidOptions);
  }
  return api::Status::Ok();
}

api::Result<PoolOptions> LoadPoolOptions(const json::Json& doc) {
  const json::Json& node = (doc.is_object() && doc.contains("pool")) ? doc["pool"] : doc;
  if (!node.is_object()) {
    return api::Result<PoolOptions>(WrongType("pool", "an object"));
  }

  PoolOptions options;
  json::Json::const_iterator name = node.find("name");
  if (name != node.end()) {
    if (!name->is_string()) return api::Result<PoolOptions>(WrongType("name", "a string"));
    options.name = name->get<std::string>();
  }

  api::Status st;
  if (!(st = ReadCount(node, "max_size", &options.max_size)).ok() ||
      !(st = ReadCount(node, "min_size", &options.min_size)).ok() ||
      !(st = ReadCount(node, "max_use", &options.max_use)).ok() ||
      !(st = ReadCount(node, "health_check_period", &options.health_check_period)).ok() ||
      !(st = ReadMillis(node, "max_idle_age_ms", &options.max_idle_age)).ok() ||
      !(st = ReadMillis(node, "max_borrow_warn_ms", &options.max_borrow_warn)).ok() ||
      !(st = ReadMillis(node, "max_borrow_kill_ms", &options.max_borrow_kill)).ok() ||
      !(st = ReadMillis(node, "housekeeping_interval_ms", &options.housekeeping_interval)).ok() ||
      !(st = ReadMillis(node, "acquire_timeout_ms", &options.acquire_timeout)).ok()) {
    return api::Result<PoolOptions>(st);
  }
  return api::Result<PoolOptions>(options);
}

api::Result<PoolOptions> LoadPoolOptionsFromFile(const std::string& path) {
  api::Result<json::Json> doc = json::JsonCodec::LoadFile(path);
  if (!doc.ok()) return api::Result<PoolOptions>(doc.status());
  return LoadPoolOptions(doc.value());
}

std::chrono::milliseconds ResolveHousekeepingInterval(const PoolOptions& options,
                                                      bool has_health_hook) {
  if (options.housekeeping_interval.count() > 0) return options.housekeeping_interval;

  const PoolOptions normalized = NormalizePoolOptions(options);
  std::chrono::milliseconds shortest(0);
  if (normalized.max_idle_age.count() > 0) shortest = normalized.max_idle_age;
  if (normalized.max_borrow_warn.count() > 0 &&
      (shortest.count() == 0 || normalized.max_borrow_warn < shortest)) {
    shortest = normalized.max_borrow_warn;
  }
  if (shortest.count() > 0) {
    return std::max(std::chrono::milliseconds(1), shortest / 2);
  }
  if (has_health_hook) return std::chrono::milliseconds(60000);
  return std::chrono::milliseconds(0);
}

PoolOptions NormalizePoolOptions(const PoolOptions& options) {
  PoolOptions out = options;
  if (out.max_borrow_warn.count() == 0) out.max_borrow_warn = out.max_borrow_kill;
  return out;
}

json::Json ToJson(const PoolOptions& options) {
  json::Json out = json::Json::object();
  out["name"] = options.name;
  out["max_size"] = options.max_size;
  out["min_size"] = options.min_size;
  out["max_use"] = options.max_use;
  out["max_idle_age_ms"] = options.max_idle_age.count();
  out["max_borrow_warn_ms"] = options.max_borrow_warn.count();
  out["max_borrow_kill_ms"] = options.max_borrow_kill.count();
  out["health_check_period"] = options.health_check_period;
  out["housekeeping_interval_ms"] = options.housekeeping_interval.count();
  out["acquire_timeout_ms"] = options.acquire_timeout.count();
  return out;
}

#undef PK_POOL_STATUS

}  // namespace pool
}  // namespace poolkit
