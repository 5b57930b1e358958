#include "poolkit/api/factory.hpp"

#include "poolkit/api/version.hpp"
#include "task/thread_pool_executor.hpp"

extern "C" {

std::uint32_t poolkit_get_api_version() { return poolkit::api::kApiVersion; }

poolkit::task::IExecutor* poolkit_create_executor(const poolkit::task::ExecutorOptions* options) {
  if (options == NULL) {
    return new poolkit::task::ThreadPoolExecutor();
  }
  return new poolkit::task::ThreadPoolExecutor(*options);
}

void poolkit_destroy_executor(poolkit::task::IExecutor* executor) {
  if (executor != NULL) executor->Release();
}

}
