#pragma once

#include <stdexcept>
#include <string>

namespace collab {

enum class ErrorKind {
  Authentication,
  Authorization,
  Persistence,
  Protocol
};

const char* toString(ErrorKind k);

class CollabError : public std::runtime_error {
public:
  CollabError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

// Caller lacks the membership or role needed for the action.
class AuthorizationError : public CollabError {
public:
  explicit AuthorizationError(const std::string& what)
    : CollabError(ErrorKind::Authorization, what) {}
};

// An external store call failed; nothing was broadcast.
class StoreError : public CollabError {
public:
  explicit StoreError(const std::string& what)
    : CollabError(ErrorKind::Persistence, what) {}
};

// Malformed or unknown inbound message.
class ProtocolError : public CollabError {
public:
  explicit ProtocolError(const std::string& what)
    : CollabError(ErrorKind::Protocol, what) {}
};

} // namespace collab
