#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace poolkit {
namespace pool {

// Counting gate bounding objects that are borrowed or being created.
// Waiters are served in no particular order.
class CapacityGate {
 public:
  explicit CapacityGate(std::size_t capacity);

  // Blocks until a token is free.
  void AcquireBlocking();
  // Returns false when no token freed up before the deadline. No token is held then.
  bool TryAcquireFor(std::chrono::milliseconds timeout);
  bool TryAcquire();
  // Returns false, and changes nothing, when every token is already free.
  bool Release();

  std::size_t Available() const;
  std::size_t Capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  std::size_t available_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
};

}  // namespace pool
}  // namespace poolkit
