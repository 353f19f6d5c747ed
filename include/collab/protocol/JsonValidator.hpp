#pragma once
#include <rapidjson/document.h>

#include <cstdint>
#include <optional>
#include <string>

#include "collab/Errors.hpp"

namespace collab::protocol {

// Field accessors for inbound payloads. Every failure throws ProtocolError.
class JsonValidator {
public:
    // {"event": "<name>", "data": {...}}; returns the event name.
    static std::string validateEnvelope(const rapidjson::Document& doc);

    static void requireObject(const rapidjson::Value& v, const char* what);

    // Present, a string, and non-empty.
    static std::string requireString(const rapidjson::Value& v, const char* name);
    // Absent or null -> nullopt; present with another type -> throw.
    static std::optional<std::string> optionalString(const rapidjson::Value& v, const char* name);
    static std::optional<double> optionalNumber(const rapidjson::Value& v, const char* name);
    static std::optional<std::int64_t> optionalInteger(const rapidjson::Value& v, const char* name);
    static std::int64_t requireInteger(const rapidjson::Value& v, const char* name);

    // Integral number representable as int64, otherwise nullopt.
    static std::optional<std::int64_t> asInt64(const rapidjson::Value& v);

    // throw if v[name] is missing or not of expectedType
    static void requireMember(const rapidjson::Value& v,
                              const char* name,
                              rapidjson::Type expectedType)
    {
        if (!v.HasMember(name) || v[name].GetType() != expectedType) {
            throw ProtocolError(
                std::string("JSON field missing or wrong-type: '") + name + "'");
        }
    }
};

} // namespace collab::protocol
