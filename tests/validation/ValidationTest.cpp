#include "collab/protocol/JsonValidator.hpp"
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <cstdint>
#include <limits>
#include <string>

using namespace collab;
using namespace collab::protocol;
using namespace rapidjson;

// Helper: parse JSON string into Document
static Document parseDoc(const std::string& s) {
    Document d;
    d.Parse(s.c_str());
    EXPECT_FALSE(d.HasParseError()) << "Failed to parse JSON: " << s;
    return d;
}

TEST(JsonValidatorEnvelopeTest, RejectsNonObject) {
    auto d = parseDoc("[1,2,3]");
    EXPECT_THROW(JsonValidator::validateEnvelope(d), ProtocolError);
}

TEST(JsonValidatorEnvelopeTest, RejectsMissingEvent) {
    auto d = parseDoc("{\"data\":{}}");
    EXPECT_THROW(JsonValidator::validateEnvelope(d), ProtocolError);
}

TEST(JsonValidatorEnvelopeTest, RejectsNonStringOrEmptyEvent) {
    auto a = parseDoc("{\"event\":5,\"data\":{}}");
    auto b = parseDoc("{\"event\":\"\",\"data\":{}}");
    EXPECT_THROW(JsonValidator::validateEnvelope(a), ProtocolError);
    EXPECT_THROW(JsonValidator::validateEnvelope(b), ProtocolError);
}

TEST(JsonValidatorEnvelopeTest, RejectsScalarData) {
    auto d = parseDoc("{\"event\":\"join_workspace\",\"data\":\"ws1\"}");
    EXPECT_THROW(JsonValidator::validateEnvelope(d), ProtocolError);
}

TEST(JsonValidatorEnvelopeTest, AcceptsValidEnvelope) {
    auto d = parseDoc("{\"event\":\"join_workspace\",\"data\":{\"workspaceId\":\"ws1\"}}");
    EXPECT_EQ(JsonValidator::validateEnvelope(d), "join_workspace");
}

TEST(JsonValidatorFieldTest, RequireStringRejectsEmptyAndWrongType) {
    auto d = parseDoc("{\"a\":\"\",\"b\":1,\"c\":\"ok\"}");
    EXPECT_THROW(JsonValidator::requireString(d, "a"), ProtocolError);
    EXPECT_THROW(JsonValidator::requireString(d, "b"), ProtocolError);
    EXPECT_THROW(JsonValidator::requireString(d, "missing"), ProtocolError);
    EXPECT_EQ(JsonValidator::requireString(d, "c"), "ok");
}

TEST(JsonValidatorFieldTest, OptionalStringTreatsNullAsAbsent) {
    auto d = parseDoc("{\"a\":null,\"b\":true,\"c\":\"x\"}");
    EXPECT_FALSE(JsonValidator::optionalString(d, "a").has_value());
    EXPECT_FALSE(JsonValidator::optionalString(d, "missing").has_value());
    EXPECT_THROW(JsonValidator::optionalString(d, "b"), ProtocolError);
    EXPECT_EQ(*JsonValidator::optionalString(d, "c"), "x");
}

TEST(JsonValidatorFieldTest, IntegersRejectFractions) {
    auto d = parseDoc("{\"i\":3,\"f\":3.0,\"g\":3.5,\"s\":\"3\"}");
    EXPECT_EQ(JsonValidator::requireInteger(d, "i"), 3);
    EXPECT_EQ(JsonValidator::requireInteger(d, "f"), 3);
    EXPECT_THROW(JsonValidator::requireInteger(d, "g"), ProtocolError);
    EXPECT_THROW(JsonValidator::requireInteger(d, "s"), ProtocolError);
    EXPECT_THROW(JsonValidator::requireInteger(d, "missing"), ProtocolError);
}

TEST(JsonValidatorFieldTest, IntegersOutsideInt64RangeAreRejected) {
    auto d = parseDoc("{\"max\":9223372036854775807,\"min\":-9223372036854775808,"
                      "\"u\":9223372036854775808,\"umax\":18446744073709551615,"
                      "\"big\":1e19,\"huge\":1e300,\"neg\":-1e300}");
    EXPECT_EQ(JsonValidator::requireInteger(d, "max"), std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(JsonValidator::requireInteger(d, "min"), std::numeric_limits<std::int64_t>::min());
    EXPECT_THROW(JsonValidator::requireInteger(d, "u"), ProtocolError);
    EXPECT_THROW(JsonValidator::requireInteger(d, "umax"), ProtocolError);
    EXPECT_THROW(JsonValidator::requireInteger(d, "big"), ProtocolError);
    EXPECT_THROW(JsonValidator::requireInteger(d, "huge"), ProtocolError);
    EXPECT_THROW(JsonValidator::optionalInteger(d, "neg"), ProtocolError);
    EXPECT_FALSE(JsonValidator::asInt64(d["umax"]).has_value());
}

TEST(JsonValidatorFieldTest, RequireMemberChecksType) {
    auto d = parseDoc("{\"o\":{},\"a\":[]}");
    EXPECT_NO_THROW(JsonValidator::requireMember(d, "o", kObjectType));
    EXPECT_THROW(JsonValidator::requireMember(d, "a", kObjectType), ProtocolError);
    EXPECT_THROW(JsonValidator::requireMember(d, "x", kObjectType), ProtocolError);
}
