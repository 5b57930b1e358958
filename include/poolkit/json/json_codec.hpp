#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"

namespace poolkit {
namespace json {

using Json = nlohmann::json;

class POOLKIT_API JsonCodec {
 public:
  // Parse JSON text into a DOM object.
  // Returns kInvalidArgument when text is not valid JSON.
  static api::Result<Json> Parse(const std::string& text);

  // Load and parse a JSON file from disk.
  // Returns kNotFound when file does not exist.
  static api::Result<Json> LoadFile(const std::string& path);

  // Serialize JSON to UTF-8 string for logging/debugging.
  static std::string Dump(const Json& value, int indent = 2);
};

}  // namespace json
}  // namespace poolkit
