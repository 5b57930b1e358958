#include "pool/capacity_gate.hpp"

namespace poolkit {
namespace pool {

CapacityGate::CapacityGate(std::size_t capacity) : capacity_(capacity), available_(capacity) {}

void CapacityGate::AcquireBlocking() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this]() { return available_ > 0; });
  --available_;
}

bool CapacityGate::TryAcquireFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  if (!cv_.wait_for(lock, timeout, [this]() { return available_ > 0; })) return false;
  --available_;
  return true;
}

bool CapacityGate::TryAcquire() {
  std::lock_guard<std::mutex> lock(mu_);
  if (available_ == 0) return false;
  --available_;
  return true;
}

bool CapacityGate::Release() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (available_ >= capacity_) return false;
    ++available_;
  }
  cv_.notify_one();
  return true;
}

std::size_t CapacityGate::Available() const {
  std::lock_guard<std::mutex> lock(mu_);
  return available_;
}

}  // namespace pool
}  // namespace poolkit
