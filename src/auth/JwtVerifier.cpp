#include "collab/auth/JwtVerifier.hpp"
#include "collab/util/Base64.hpp"
#include "collab/util/Clock.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <rapidjson/document.h>

#include <chrono>
#include <cmath>

namespace collab::auth {

JwtVerifier::JwtVerifier(std::string secret, const util::Clock* clock)
  : secret_(std::move(secret))
  , clock_(clock ? clock : &util::systemClock())
{}

std::string JwtVerifier::hmacSha256(const std::string& key, const std::string& data) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int outLen = 0;
  const unsigned char* res = HMAC(EVP_sha256(),
                                  key.data(), static_cast<int>(key.size()),
                                  reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                  out, &outLen);
  if (!res) return {};
  return std::string(reinterpret_cast<const char*>(out), outLen);
}

std::string JwtVerifier::sign(const std::string& payloadJson, const std::string& secret) {
  const std::string header  = util::base64UrlEncode(R"({"alg":"HS256","typ":"JWT"})");
  const std::string payload = util::base64UrlEncode(payloadJson);
  const std::string signingInput = header + "." + payload;
  return signingInput + "." + util::base64UrlEncode(hmacSha256(secret, signingInput));
}

Result<TokenClaims> JwtVerifier::verify(const std::string& token) const {
  if (token.empty()) return Error{"Authentication token required", "missing_token"};
  if (secret_.empty()) return Error{"No signing secret configured", "no_secret"};

  const auto dot1 = token.find('.');
  const auto dot2 = dot1 == std::string::npos ? std::string::npos : token.find('.', dot1 + 1);
  if (dot1 == std::string::npos || dot2 == std::string::npos ||
      token.find('.', dot2 + 1) != std::string::npos) {
    return Error{"Token must have three segments", "malformed_token"};
  }

  const std::string signingInput = token.substr(0, dot2);
  auto header  = util::base64UrlDecode(std::string_view(token).substr(0, dot1));
  auto payload = util::base64UrlDecode(std::string_view(token).substr(dot1 + 1, dot2 - dot1 - 1));
  auto sig     = util::base64UrlDecode(std::string_view(token).substr(dot2 + 1));
  if (!header || !payload || !sig) return Error{"Token is not valid base64url", "malformed_token"};

  rapidjson::Document h;
  if (h.Parse(header->c_str()).HasParseError() || !h.IsObject() ||
      !h.HasMember("alg") || !h["alg"].IsString() ||
      std::string(h["alg"].GetString()) != "HS256") {
    return Error{"Unsupported token algorithm", "bad_algorithm"};
  }

  const std::string expected = hmacSha256(secret_, signingInput);
  if (expected.empty() || expected.size() != sig->size() ||
      CRYPTO_memcmp(expected.data(), sig->data(), expected.size()) != 0) {
    return Error{"Invalid token signature", "bad_signature"};
  }

  rapidjson::Document p;
  if (p.Parse(payload->c_str()).HasParseError() || !p.IsObject()) {
    return Error{"Token payload is not a JSON object", "malformed_token"};
  }

  TokenClaims claims;
  if (p.HasMember("userId") && p["userId"].IsString()) {
    claims.userId = p["userId"].GetString();
  } else if (p.HasMember("sub") && p["sub"].IsString()) {
    claims.userId = p["sub"].GetString();
  }
  if (claims.userId.empty()) return Error{"Token has no user id", "missing_subject"};

  if (p.HasMember("exp")) {
    if (!p["exp"].IsNumber()) return Error{"Token exp is not numeric", "malformed_token"};
    if (p["exp"].IsInt64()) {
      claims.exp = p["exp"].GetInt64();
    } else {
      // NumericDate may be fractional; it must still fit an int64.
      const double d = p["exp"].GetDouble();
      if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
        return Error{"Token exp out of range", "malformed_token"};
      }
      claims.exp = static_cast<std::int64_t>(std::floor(d));
    }
    const auto nowSec = std::chrono::duration_cast<std::chrono::seconds>(
        clock_->now().time_since_epoch()).count();
    if (*claims.exp <= nowSec) return Error{"Token expired", "expired"};
  }

  return claims;
}

} // namespace collab::auth
