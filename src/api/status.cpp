#include "poolkit/api/status.hpp"

#include <cstdio>

namespace poolkit {
namespace api {

namespace {

inline std::uint32_t PackErrorCode(std::uint8_t module, std::uint8_t status, std::uint32_t detail) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status) & 0x0Fu) << 20) |
         (detail & 0x000FFFFFu);
}

#define POOLKIT_ECODE(module, status, detail) \
  PackErrorCode(static_cast<std::uint8_t>(module), static_cast<std::uint8_t>(status), detail)

static const ErrorCatalogEntry kErrorCatalog[] = {
    // Core generic status family (detail id = 0)
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kOk, 0x0000), "CORE_OK",
     "Operation succeeded"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kInvalidArgument, 0x0000),
     "CORE_INVALID_ARGUMENT", "Invalid argument"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kNotInitialized, 0x0000),
     "CORE_NOT_INITIALIZED", "Object not initialized"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kNotFound, 0x0000), "CORE_NOT_FOUND",
     "Resource not found"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kWouldBlock, 0x0000), "CORE_WOULD_BLOCK",
     "Operation would block"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kIoError, 0x0000), "CORE_IO_ERROR",
     "I/O error"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kInternalError, 0x0000),
     "CORE_INTERNAL_ERROR", "Internal error"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kUnsupported, 0x0000), "CORE_UNSUPPORTED",
     "Operation unsupported"},

    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kTimeout, detail_id::kPoolAcquireTimeout),
     "POOL_ACQUIRE_TIMEOUT", "No capacity token was obtained before the deadline"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kCreationError, detail_id::kPoolCreateFailed),
     "POOL_CREATE_FAILED", "Object factory failed"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kShuttingDown, detail_id::kPoolShuttingDown),
     "POOL_SHUTTING_DOWN", "Pool is shutting down"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kInvalidConfiguration,
                   detail_id::kPoolInvalidOptions),
     "POOL_INVALID_OPTIONS", "Pool options are inconsistent"},
    {POOLKIT_ECODE(ErrorModule::kProxy, StatusCode::kInvalidConfiguration,
                   detail_id::kProxyBothSources),
     "PROXY_BOTH_SOURCES", "Proxy cannot bind both an object and a factory"},
    {POOLKIT_ECODE(ErrorModule::kProxy, StatusCode::kInvalidConfiguration,
                   detail_id::kProxyNoSource),
     "PROXY_NO_SOURCE", "Proxy has neither an object nor a factory"},
    {POOLKIT_ECODE(ErrorModule::kProxy, StatusCode::kInvalidConfiguration,
                   detail_id::kProxyRebindAfterUse),
     "PROXY_REBIND_AFTER_USE", "Proxy source cannot change after first use"},
    {POOLKIT_ECODE(ErrorModule::kProxy, StatusCode::kInvalidConfiguration,
                   detail_id::kProxyPoolLocked),
     "PROXY_POOL_LOCKED", "Pool options cannot change once the pool exists"},
    {POOLKIT_ECODE(ErrorModule::kProxy, StatusCode::kInvalidConfiguration,
                   detail_id::kProxyNoTaskContext),
     "PROXY_NO_TASK_CONTEXT", "Task-scoped proxy used outside a task context"},
    {POOLKIT_ECODE(ErrorModule::kProxy, StatusCode::kInvalidConfiguration,
                   detail_id::kProxyFixedObjectScope),
     "PROXY_FIXED_OBJECT_SCOPE", "A fixed object only supports shared scope"},
    {POOLKIT_ECODE(ErrorModule::kProxy, StatusCode::kCreationError,
                   detail_id::kProxyCreateFailed),
     "PROXY_CREATE_FAILED", "Unpooled proxy factory failed"},
    {POOLKIT_ECODE(ErrorModule::kTask, StatusCode::kWouldBlock, detail_id::kTaskQueueFull),
     "TASK_QUEUE_FULL", "Task queue is full"},
    {POOLKIT_ECODE(ErrorModule::kJson, StatusCode::kInvalidArgument,
                   detail_id::kJsonParseFailed),
     "JSON_PARSE_FAILED", "JSON parse failed"},
};

#undef POOLKIT_ECODE

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return PackErrorCode(static_cast<std::uint8_t>(module),
                       static_cast<std::uint8_t>(status_code), detail_id);
}

const char* ErrorModuleName(ErrorModule module) {
  switch (module) {
    case ErrorModule::kCore:
      return "core";
    case ErrorModule::kLog:
      return "log";
    case ErrorModule::kJson:
      return "json";
    case ErrorModule::kTask:
      return "task";
    case ErrorModule::kPool:
      return "pool";
    case ErrorModule::kProxy:
      return "proxy";
    default:
      return "unknown";
  }
}

const char* StatusCodeName(StatusCode status_code) {
  switch (status_code) {
    case StatusCode::kOk:
      return "kOk";
    case StatusCode::kInvalidArgument:
      return "kInvalidArgument";
    case StatusCode::kNotInitialized:
      return "kNotInitialized";
    case StatusCode::kNotFound:
      return "kNotFound";
    case StatusCode::kWouldBlock:
      return "kWouldBlock";
    case StatusCode::kIoError:
      return "kIoError";
    case StatusCode::kInternalError:
      return "kInternalError";
    case StatusCode::kUnsupported:
      return "kUnsupported";
    case StatusCode::kTimeout:
      return "kTimeout";
    case StatusCode::kCreationError:
      return "kCreationError";
    case StatusCode::kInvalidConfiguration:
      return "kInvalidConfiguration";
    case StatusCode::kShuttingDown:
      return "kShuttingDown";
    default:
      return "kUnknown";
  }
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  for (std::size_t i = 0; i < sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]); ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) {
      return &kErrorCatalog[i];
    }
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11] = {0};  // "0xFFFFFFFF"
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

std::string Status::ToString() const {
  std::string out = StatusCodeName(code_);
  out += "(";
  out += FormatErrorCodeHex(hex_code_);
  out += ")";
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

}  // namespace api
}  // namespace poolkit
