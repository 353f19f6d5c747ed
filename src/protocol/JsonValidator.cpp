#include "collab/protocol/JsonValidator.hpp"

#include <cmath>
#include <string>

namespace collab::protocol {

std::string JsonValidator::validateEnvelope(const rapidjson::Document& doc) {
  if (!doc.IsObject()) {
    throw ProtocolError("Frame must be a JSON object");
  }

  if (!doc.HasMember("event") || !doc["event"].IsString() ||
      doc["event"].GetStringLength() == 0) {
    throw ProtocolError("Frame missing string 'event'");
  }

  if (doc.HasMember("data") && !doc["data"].IsObject() && !doc["data"].IsNull()) {
    throw ProtocolError("Frame 'data' must be an object");
  }

  return doc["event"].GetString();
}

void JsonValidator::requireObject(const rapidjson::Value& v, const char* what) {
  if (!v.IsObject()) {
    throw ProtocolError(std::string(what) + " must be an object");
  }
}

std::string JsonValidator::requireString(const rapidjson::Value& v, const char* name) {
  if (!v.HasMember(name) || !v[name].IsString()) {
    throw ProtocolError(std::string("Missing string field '") + name + "'");
  }
  std::string s(v[name].GetString(), v[name].GetStringLength());
  if (s.empty()) {
    throw ProtocolError(std::string("Field '") + name + "' must not be empty");
  }
  return s;
}

std::optional<std::string> JsonValidator::optionalString(const rapidjson::Value& v, const char* name) {
  if (!v.HasMember(name) || v[name].IsNull()) return std::nullopt;
  if (!v[name].IsString()) {
    throw ProtocolError(std::string("Field '") + name + "' must be a string");
  }
  return std::string(v[name].GetString(), v[name].GetStringLength());
}

std::optional<double> JsonValidator::optionalNumber(const rapidjson::Value& v, const char* name) {
  if (!v.HasMember(name) || v[name].IsNull()) return std::nullopt;
  if (!v[name].IsNumber()) {
    throw ProtocolError(std::string("Field '") + name + "' must be a number");
  }
  return v[name].GetDouble();
}

std::optional<std::int64_t> JsonValidator::asInt64(const rapidjson::Value& v) {
  if (!v.IsNumber()) return std::nullopt;
  if (v.IsInt64()) return v.GetInt64();
  // Uint64 above INT64_MAX, or a double.
  if (v.IsUint64()) return std::nullopt;
  const double d = v.GetDouble();
  // [-2^63, 2^63): both bounds are exact doubles.
  if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) return std::nullopt;
  if (std::floor(d) != d) return std::nullopt;
  return static_cast<std::int64_t>(d);
}

std::optional<std::int64_t> JsonValidator::optionalInteger(const rapidjson::Value& v, const char* name) {
  if (!optionalNumber(v, name)) return std::nullopt;
  auto i = asInt64(v[name]);
  if (!i) {
    throw ProtocolError(std::string("Field '") + name + "' must be an integer in int64 range");
  }
  return i;
}

std::int64_t JsonValidator::requireInteger(const rapidjson::Value& v, const char* name) {
  auto i = optionalInteger(v, name);
  if (!i) {
    throw ProtocolError(std::string("Missing integer field '") + name + "'");
  }
  return *i;
}

} // namespace collab::protocol
