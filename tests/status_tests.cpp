#include "poolkit/api/status.hpp"
#include "poolkit/api/factory.hpp"
#include "poolkit/api/version.hpp"

#include <cstdio>
#include <iostream>
#include <string>

namespace api = poolkit::api;

bool TestApiVersion() { return poolkit_get_api_version() == api::kApiVersion; }

bool TestDefaultStatusIsOk() {
  api::Status st;
  return st.ok() && st.code() == api::StatusCode::kOk && st.hex_code() == 0;
}

bool TestErrorCodePacking() {
  const std::uint32_t code = api::MakeErrorCode(api::ErrorModule::kPool, api::StatusCode::kTimeout,
                                                api::detail_id::kPoolAcquireTimeout);
  return code == 0x40800001u && api::FormatErrorCodeHex(code) == "0x40800001";
}

bool TestCatalogLookup() {
  api::Status st = api::Status::FromModule(api::StatusCode::kInvalidConfiguration, "both",
                                           api::ErrorModule::kProxy,
                                           api::detail_id::kProxyBothSources);
  const api::ErrorCatalogEntry* entry = api::FindErrorCatalogEntry(st.hex_code());
  if (entry == NULL) return false;
  if (std::string(entry->symbol) != "PROXY_BOTH_SOURCES") return false;
  return api::FindErrorCatalogEntry(0xFFFFFFFFu) == NULL;
}

bool TestToString() {
  api::Status st = api::Status::FromModule(api::StatusCode::kCreationError, "factory exploded",
                                           api::ErrorModule::kPool,
                                           api::detail_id::kPoolCreateFailed);
  return st.ToString() == "kCreationError(0x40900002): factory exploded" &&
         std::string(api::ErrorModuleName(api::ErrorModule::kPool)) == "pool";
}

bool TestResultCarriesValueOrStatus() {
  api::Result<int> good(42);
  api::Result<int> bad(api::Status(api::StatusCode::kNotFound, "missing"));
  return good.ok() && good.value() == 42 && !bad.ok() &&
         bad.status().code() == api::StatusCode::kNotFound;
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"api_version", TestApiVersion},
      {"default_status_ok", TestDefaultStatusIsOk},
      {"error_code_packing", TestErrorCodePacking},
      {"catalog_lookup", TestCatalogLookup},
      {"to_string", TestToString},
      {"result_value_or_status", TestResultCarriesValueOrStatus},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
