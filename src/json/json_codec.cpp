#include "poolkit/json/json_codec.hpp"

#include <fstream>
#include <sstream>

namespace poolkit {
namespace json {

api::Result<Json> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Json>(Json::parse(text));
  } catch (const std::exception& ex) {
    return api::Result<Json>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, std::string("json parse failed: ") + ex.what(),
        api::ErrorModule::kJson, api::detail_id::kJsonParseFailed));
  }
}

api::Result<Json> JsonCodec::LoadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<Json>(api::Status::FromModule(
        api::StatusCode::kNotFound, "json file not found: " + path, api::ErrorModule::kJson));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str());
}

std::string JsonCodec::Dump(const Json& value, int indent) {
  // Invalid UTF-8 in descriptors is replaced rather than thrown.
  return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

}  // namespace json
}  // namespace poolkit
