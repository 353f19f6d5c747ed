#include "collab/auth/SessionAuthenticator.hpp"
#include "collab/auth/JwtVerifier.hpp"
#include "collab/store/Stores.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <cctype>
#include <exception>

namespace collab::auth {

namespace {

std::string urlDecode(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size() &&
        std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(std::string(s.substr(i + 1, 2)), nullptr, 16)));
      i += 2;
    } else if (s[i] == '+') {
      out.push_back(' ');
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

} // namespace

SessionAuthenticator::SessionAuthenticator(const JwtVerifier* verifier, store::UserDirectory* users)
  : verifier_(verifier), users_(users)
{}

std::string SessionAuthenticator::extractCredential(std::string_view authorization,
                                                    std::string_view target,
                                                    bool allowQuery) {
  constexpr std::string_view kBearer = "Bearer ";
  if (authorization.size() > kBearer.size()) {
    bool match = true;
    for (std::size_t i = 0; i < kBearer.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(authorization[i])) !=
          std::tolower(static_cast<unsigned char>(kBearer[i]))) {
        match = false;
        break;
      }
    }
    if (match) {
      auto tok = authorization.substr(kBearer.size());
      while (!tok.empty() && tok.front() == ' ') tok.remove_prefix(1);
      while (!tok.empty() && tok.back() == ' ') tok.remove_suffix(1);
      if (!tok.empty()) return std::string(tok);
    }
  }

  if (!allowQuery) return {};

  const auto q = target.find('?');
  if (q == std::string_view::npos) return {};
  auto query = target.substr(q + 1);
  while (!query.empty()) {
    const auto amp = query.find('&');
    const auto pair = query.substr(0, amp);
    const auto eq = pair.find('=');
    if (eq != std::string_view::npos && pair.substr(0, eq) == "token") {
      return urlDecode(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) break;
    query.remove_prefix(amp + 1);
  }
  return {};
}

Result<Identity> SessionAuthenticator::authenticate(const std::string& credential) const {
  if (!verifier_ || !users_) return Error{"Authenticator not configured", "unavailable"};

  auto claims = verifier_->verify(credential);
  if (!claims) {
    COLLAB_METRIC_HIT("auth.rejected");
    util::logger().log(util::LogLevel::Info, "auth.rejected",
                       {{"reason", claims.error().code}});
    return claims.error();
  }

  std::optional<Identity> user;
  try {
    user = users_->findUser(claims->userId);
  } catch (const std::exception& ex) {
    COLLAB_METRIC_HIT("auth.rejected");
    util::logger().log(util::LogLevel::Warn, "auth.directory_failed",
                       {{"userId", claims->userId}, {"error", ex.what()}});
    return Error{"User lookup failed", "directory_unavailable"};
  }

  if (!user) {
    COLLAB_METRIC_HIT("auth.rejected");
    util::logger().log(util::LogLevel::Info, "auth.rejected",
                       {{"reason", "unknown_user"}, {"userId", claims->userId}});
    return Error{"Invalid user", "unknown_user"};
  }

  COLLAB_METRIC_HIT("auth.accepted");
  return *user;
}

} // namespace collab::auth
