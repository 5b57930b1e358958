#include "poolkit/pool/pool_stats.hpp"

namespace poolkit {
namespace pool {
namespace {

json::Json RelativeSecs(double secs) {
  if (secs < 0.0) return json::Json();
  return json::Json(secs);
}

json::Json ObjectsToJson(const std::vector<ObjectStats>& objects) {
  json::Json out = json::Json::array();
  for (std::size_t i = 0; i < objects.size(); ++i) {
    const ObjectStats& obj = objects[i];
    json::Json entry = json::Json::object();
    entry["seq"] = obj.seq;
    entry["uses"] = obj.uses;
    entry["last_get"] = RelativeSecs(obj.last_get_secs);
    entry["last_ret"] = RelativeSecs(obj.last_ret_secs);
    if (obj.descriptor.is_string()) {
      entry["trace"] = obj.descriptor;
    } else if (!obj.descriptor.is_null()) {
      entry["stats"] = obj.descriptor;
    }
    out.push_back(entry);
  }
  return out;
}

}  // namespace

json::Json ToJson(const PoolStats& stats) {
  json::Json out = ToJson(stats.options);
  out["started"] = stats.started;
  if (stats.bounded) {
    out["sem"] = {{"value", stats.gate_value}, {"init", stats.gate_init}};
  } else {
    out["sem"] = nullptr;
  }
  out["navail"] = stats.navail;
  out["nusing"] = stats.nusing;
  out["ntodel"] = stats.ntodel;
  out["running"] = stats.running_secs;
  out["rel_hk_last"] = RelativeSecs(stats.last_hk_secs);
  out["delay_ms"] = stats.housekeeping_interval.count();
  out["housekeeper"] = stats.housekeeper_running;
  out["shutdown"] = stats.shutdown;
  out["avail"] = ObjectsToJson(stats.available);
  out["using"] = ObjectsToJson(stats.in_use);

  const PoolCounters& c = stats.counters;
  out["nobjs"] = c.nobjs;
  out["ncreating"] = c.ncreating;
  out["ncreated"] = c.ncreated;
  out["nuses"] = c.nuses;
  out["nkilled"] = c.nkilled;
  out["nrecycled"] = c.nrecycled;
  out["nwornout"] = c.nwornout;
  out["ndestroys"] = c.ndestroys;
  out["nborrows"] = c.nborrows;
  out["nreturns"] = c.nreturns;
  out["nhealth"] = c.nhealth;
  out["bad_health"] = c.bad_health;
  out["hk_rounds"] = c.hk_rounds;
  out["hk_errors"] = c.hk_errors;
  out["time_per_hk"] = c.hk_rounds > 0 ? c.hk_time_secs / static_cast<double>(c.hk_rounds) : 0.0;
  out["hc_rounds"] = c.hc_rounds;
  out["hc_errors"] = c.hc_errors;
  return out;
}

}  // namespace pool
}  // namespace poolkit
