#pragma once

#include "collab/Result.hpp"
#include "collab/Types.hpp"

#include <string>
#include <string_view>

namespace collab::store { class UserDirectory; }

namespace collab::auth {

class JwtVerifier;

// Gate in front of the WebSocket upgrade: credential -> known user.
class SessionAuthenticator {
public:
  SessionAuthenticator(const JwtVerifier* verifier, store::UserDirectory* users);

  Result<Identity> authenticate(const std::string& credential) const;

  // Bearer token from "Authorization: Bearer <t>", else from ?token=<t>
  // in the request target when allowQuery is set. Empty if absent.
  static std::string extractCredential(std::string_view authorization,
                                       std::string_view target,
                                       bool allowQuery);

private:
  const JwtVerifier*    verifier_;
  store::UserDirectory* users_;
};

} // namespace collab::auth
