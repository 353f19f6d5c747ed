#pragma once

#include "collab/Result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace collab::util { class Clock; }

namespace collab::auth {

struct TokenClaims {
  std::string userId;
  std::optional<std::int64_t> exp; // seconds since epoch
};

// HS256 JSON Web Token verification (HMAC-SHA256 via OpenSSL).
// The user id is read from the "userId" claim, falling back to "sub".
class JwtVerifier {
public:
  explicit JwtVerifier(std::string secret, const util::Clock* clock = nullptr);

  Result<TokenClaims> verify(const std::string& token) const;

  // Builds a signed HS256 token for the given JSON payload.
  static std::string sign(const std::string& payloadJson, const std::string& secret);

private:
  static std::string hmacSha256(const std::string& key, const std::string& data);

  std::string secret_;
  const util::Clock* clock_;
};

} // namespace collab::auth
