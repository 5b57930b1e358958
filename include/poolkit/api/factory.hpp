#pragma once

#include <cstdint>

#include "poolkit/api/export.hpp"

namespace poolkit {
namespace task {
class IExecutor;
struct ExecutorOptions;
}
}  // namespace poolkit

extern "C" {

// Return packed API version to allow runtime ABI compatibility checks.
POOLKIT_API std::uint32_t poolkit_get_api_version();

// Create an executor instance owned by the caller. options may be NULL.
POOLKIT_API poolkit::task::IExecutor* poolkit_create_executor(
    const poolkit::task::ExecutorOptions* options);

// Destroy an executor created by poolkit_create_executor.
POOLKIT_API void poolkit_destroy_executor(poolkit::task::IExecutor* executor);

}
