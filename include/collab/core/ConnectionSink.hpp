#pragma once

#include <string>

namespace collab::core {

// Outbound side of one client connection. Implementations must not block
// on the network: sendText() only enqueues.
class ConnectionSink {
public:
  virtual ~ConnectionSink() = default;
  virtual void sendText(std::string frame) = 0;
  virtual void close() = 0;
};

} // namespace collab::core
