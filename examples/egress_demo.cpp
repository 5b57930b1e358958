#include "poolkit/poolkit.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace api = poolkit::api;
namespace pool = poolkit::pool;
namespace proxy = poolkit::proxy;
using poolkit::log::LogManager;
using poolkit::log::LogSeverity;

// What callers need from an outbound connection through a rotating egress address.
class IEgressSession {
 public:
  virtual ~IEgressSession() {}
  virtual std::string Address() const = 0;
  virtual api::Result<std::string> Fetch(const std::string& url) = 0;
};

class EgressSession : public IEgressSession {
 public:
  explicit EgressSession(std::uint64_t seq)
      : address_("10.20.0." + std::to_string(10 + seq % 200) + ":3128"), requests_(0) {}

  std::string Address() const override { return address_; }

  api::Result<std::string> Fetch(const std::string& url) override {
    ++requests_;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return api::Result<std::string>("200 " + url + " via " + address_);
  }

  int requests() const { return requests_; }

 private:
  std::string address_;
  std::atomic<int> requests_;
};

// Drop-in IEgressSession that routes each call to the calling thread's session.
class ProxiedEgressSession : public IEgressSession {
 public:
  explicit ProxiedEgressSession(proxy::Proxy<IEgressSession>* target) : target_(target) {}

  std::string Address() const override {
    std::string out;
    api::Status st = target_->Forward([&out](IEgressSession& s) { out = s.Address(); });
    if (!st.ok()) LogManager::Log(LogSeverity::kError, st.ToString());
    return out;
  }

  api::Result<std::string> Fetch(const std::string& url) override {
    api::Result<std::string> out(api::Status(api::StatusCode::kInternalError, "not forwarded"));
    api::Status st = target_->Forward([&out, &url](IEgressSession& s) { out = s.Fetch(url); });
    if (!st.ok()) return api::Result<std::string>(st);
    return out;
  }

 private:
  proxy::Proxy<IEgressSession>* target_;
};

int main(int argc, char* argv[]) {
  const std::string log_config = argc > 1 ? argv[1] : "config/logging.conf";
  const std::string pool_config = argc > 2 ? argv[2] : "config/pool.json";

  api::Status st = LogManager::Init(argv[0], log_config);
  if (!st.ok()) {
    std::fprintf(stderr, "logging init failed: %s\n", st.ToString().c_str());
    return 1;
  }

  api::Result<pool::PoolOptions> options = pool::LoadPoolOptionsFromFile(pool_config);
  if (!options.ok()) {
    LogManager::Log(LogSeverity::kError, options.status().ToString());
    LogManager::Shutdown();
    return 1;
  }

  proxy::ProxyOptions proxy_options;
  proxy_options.scope = proxy::Scope::kThread;
  proxy_options.pool = options.value();

  proxy::Proxy<IEgressSession> sessions(proxy_options);
  st = sessions.SetFactory([](std::uint64_t seq) {
    return api::Result<IEgressSession*>(new EgressSession(seq));
  });
  proxy::Proxy<IEgressSession>::PoolHooks hooks;
  hooks.is_healthy = [](IEgressSession* s) { return !s->Address().empty(); };
  hooks.describe = [](IEgressSession* s) {
    poolkit::json::Json d = poolkit::json::Json::object();
    d["address"] = s->Address();
    d["requests"] = static_cast<EgressSession*>(s)->requests();
    return d;
  };
  if (st.ok()) st = sessions.SetPoolHooks(hooks);
  if (!st.ok()) {
    LogManager::Log(LogSeverity::kError, st.ToString());
    LogManager::Shutdown();
    return 1;
  }

  ProxiedEgressSession egress(&sessions);
  std::atomic<int> failures(0);
  std::vector<std::thread> workers;
  for (int w = 0; w < 6; ++w) {
    workers.push_back(std::thread([&egress, &sessions, &failures, w]() {
      for (int i = 0; i < 10; ++i) {
        api::Result<std::string> body =
            egress.Fetch("https://queue.example/slot/" + std::to_string(w * 10 + i));
        if (!body.ok()) {
          ++failures;
          LogManager::Log(LogSeverity::kWarning, body.status().ToString());
          continue;
        }
        if (i % 5 == 4) {
          // Rotate: hand the session back so the next request may draw another one.
          api::Status released = sessions.Release();
          if (!released.ok()) LogManager::Log(LogSeverity::kError, released.ToString());
        }
      }
      api::Status released = sessions.Release();
      if (!released.ok()) LogManager::Log(LogSeverity::kError, released.ToString());
    }));
  }
  for (std::size_t i = 0; i < workers.size(); ++i) workers[i].join();

  std::shared_ptr<pool::Pool<IEgressSession> > backing = sessions.pool();
  if (backing) {
    backing->Flush();
    std::printf("%s\n", poolkit::json::JsonCodec::Dump(backing->StatsJson()).c_str());
  }
  std::ostringstream summary;
  summary << "egress demo finished, failures=" << failures.load();
  LogManager::Log(LogSeverity::kInfo, summary.str());
  LogManager::Shutdown();
  return failures.load() == 0 ? 0 : 2;
}
