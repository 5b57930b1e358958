#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "poolkit/api/export.hpp"

namespace poolkit {
namespace api {

enum class StatusCode {
  kOk = 0,
  kInvalidArgument,
  kNotInitialized,
  kNotFound,
  kWouldBlock,
  kIoError,
  kInternalError,
  kUnsupported,
  // Capacity token not obtained before the deadline. Retryable.
  kTimeout,
  // Object factory failed; the message carries the underlying cause.
  kCreationError,
  // Conflicting or missing setup. Programmer error, not retryable.
  kInvalidConfiguration,
  // Operation attempted on a pool that has been shut down.
  kShuttingDown
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kLog = 0x10,
  kJson = 0x20,
  kTask = 0x30,
  kPool = 0x40,
  kProxy = 0x50,
};

// Module-local detail ids, stable across releases.
namespace detail_id {
static const std::uint32_t kPoolAcquireTimeout = 0x0001;
static const std::uint32_t kPoolCreateFailed = 0x0002;
static const std::uint32_t kPoolShuttingDown = 0x0003;
static const std::uint32_t kPoolInvalidOptions = 0x0004;
static const std::uint32_t kProxyBothSources = 0x0001;
static const std::uint32_t kProxyNoSource = 0x0002;
static const std::uint32_t kProxyRebindAfterUse = 0x0003;
static const std::uint32_t kProxyPoolLocked = 0x0004;
static const std::uint32_t kProxyNoTaskContext = 0x0005;
static const std::uint32_t kProxyFixedObjectScope = 0x0006;
static const std::uint32_t kProxyCreateFailed = 0x0007;
static const std::uint32_t kTaskQueueFull = 0x0001;
static const std::uint32_t kJsonParseFailed = 0x0001;
}  // namespace detail_id

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// Code layout: 0xMMSDDDDD
// - MM: module id
// - S: status code family (4 bits)
// - DDDDD: module-local detail id (20 bits)
POOLKIT_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                        std::uint32_t detail_id = 0);
POOLKIT_API const char* ErrorModuleName(ErrorModule module);
POOLKIT_API const char* StatusCodeName(StatusCode status_code);
POOLKIT_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
POOLKIT_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

class Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message)
      : code_(code), message_(std::move(message)),
        hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message, ErrorModule module, std::uint32_t detail_id = 0)
      : code_(code),
        message_(std::move(message)),
        hex_code_(MakeErrorCode(module, code_, detail_id)) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module,
                           std::uint32_t detail_id = 0) {
    return Status(code, std::move(message), module, detail_id);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }

  // "kTimeout(0x40800001): pool 'db' acquire timed out after 100 ms"
  std::string ToString() const;

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
};

template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), value_() {}
  Result(const T& value) : status_(Status::Ok()), value_(value) {}

  bool ok() const { return status_.ok(); }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  T value_;
};

}  // namespace api
}  // namespace poolkit
