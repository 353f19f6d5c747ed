#include "collab/auth/JwtVerifier.hpp"
#include "collab/util/Base64.hpp"
#include "support/TestSupport.hpp"
#include <gtest/gtest.h>

using namespace collab;
using namespace collab::auth;
using collab::test::ManualClock;

namespace {

const std::string kSecret = "unit-test-secret";

std::int64_t nowSeconds(const ManualClock& c) {
    return std::chrono::duration_cast<std::chrono::seconds>(c.now().time_since_epoch()).count();
}

} // namespace

TEST(JwtVerifierTest, AcceptsValidToken) {
    ManualClock clock;
    JwtVerifier v(kSecret, &clock);
    auto r = v.verify(JwtVerifier::sign(R"({"userId":"alice"})", kSecret));
    ASSERT_TRUE(r) << r.error().describe();
    EXPECT_EQ(r->userId, "alice");
    EXPECT_FALSE(r->exp.has_value());
}

TEST(JwtVerifierTest, FallsBackToSubClaim) {
    ManualClock clock;
    JwtVerifier v(kSecret, &clock);
    auto r = v.verify(JwtVerifier::sign(R"({"sub":"bob"})", kSecret));
    ASSERT_TRUE(r);
    EXPECT_EQ(r->userId, "bob");
}

TEST(JwtVerifierTest, RejectsWrongSecret) {
    ManualClock clock;
    JwtVerifier v(kSecret, &clock);
    auto r = v.verify(JwtVerifier::sign(R"({"userId":"alice"})", "other-secret"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, "bad_signature");
}

TEST(JwtVerifierTest, RejectsTamperedPayload) {
    ManualClock clock;
    JwtVerifier v(kSecret, &clock);
    auto token = JwtVerifier::sign(R"({"userId":"alice"})", kSecret);
    const auto d1 = token.find('.');
    const auto d2 = token.find('.', d1 + 1);
    token = token.substr(0, d1 + 1) + util::base64UrlEncode(R"({"userId":"mallory"})") + token.substr(d2);
    auto r = v.verify(token);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, "bad_signature");
}

TEST(JwtVerifierTest, ExpiryIsCheckedAgainstClock) {
    ManualClock clock;
    JwtVerifier v(kSecret, &clock);
    const auto now = nowSeconds(clock);

    auto live = v.verify(test::makeToken("alice", kSecret, now + 60));
    ASSERT_TRUE(live);
    EXPECT_EQ(*live->exp, now + 60);

    clock.advance(std::chrono::seconds(61));
    auto dead = v.verify(test::makeToken("alice", kSecret, now + 60));
    ASSERT_FALSE(dead);
    EXPECT_EQ(dead.error().code, "expired");
}

TEST(JwtVerifierTest, RejectsMalformedTokens) {
    JwtVerifier v(kSecret);
    EXPECT_EQ(v.verify("").error().code, "missing_token");
    EXPECT_EQ(v.verify("abc").error().code, "malformed_token");
    EXPECT_EQ(v.verify("a.b.c.d").error().code, "malformed_token");
    EXPECT_EQ(v.verify("a!.b.c").error().code, "malformed_token");
}

TEST(JwtVerifierTest, RejectsNoneAlgorithm) {
    JwtVerifier v(kSecret);
    const std::string token = util::base64UrlEncode(R"({"alg":"none","typ":"JWT"})") + "." +
                              util::base64UrlEncode(R"({"userId":"alice"})") + ".";
    auto r = v.verify(token);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, "bad_algorithm");
}

TEST(JwtVerifierTest, RejectsTokenWithoutSubject) {
    JwtVerifier v(kSecret);
    auto r = v.verify(JwtVerifier::sign(R"({"name":"nobody"})", kSecret));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, "missing_subject");
}

TEST(JwtVerifierTest, EmptySecretRejectsEverything) {
    JwtVerifier v("");
    auto r = v.verify(JwtVerifier::sign(R"({"userId":"alice"})", ""));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, "no_secret");
}

TEST(JwtVerifierTest, ExpOutsideInt64RangeIsMalformed) {
    ManualClock clock;
    JwtVerifier v(kSecret, &clock);
    for (const char* payload : {R"({"userId":"alice","exp":1e300})",
                                R"({"userId":"alice","exp":18446744073709551615})",
                                R"({"userId":"alice","exp":-1e19})"}) {
        auto r = v.verify(JwtVerifier::sign(payload, kSecret));
        ASSERT_FALSE(r) << payload;
        EXPECT_EQ(r.error().code, "malformed_token") << payload;
    }
}

TEST(JwtVerifierTest, FractionalExpIsTruncated) {
    ManualClock clock;
    JwtVerifier v(kSecret, &clock);
    const auto exp = nowSeconds(clock) + 60;
    auto r = v.verify(JwtVerifier::sign(
        R"({"userId":"alice","exp":)" + std::to_string(exp) + ".5}", kSecret));
    ASSERT_TRUE(r) << r.error().describe();
    EXPECT_EQ(*r->exp, exp);
}

TEST(Base64UrlTest, DecodeAcceptsOnlyUrlAlphabet) {
    ASSERT_TRUE(util::base64UrlDecode("-_8").has_value());
    EXPECT_EQ(*util::base64UrlDecode("-_8"), std::string("\xfb\xff", 2));
    EXPECT_FALSE(util::base64UrlDecode("+_8").has_value());
    EXPECT_FALSE(util::base64UrlDecode("-/8").has_value());
    EXPECT_EQ(*util::base64UrlDecode(util::base64UrlEncode("\xfb\xff\xfe")), "\xfb\xff\xfe");
}
