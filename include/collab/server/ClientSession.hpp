#pragma once
#include <boost/asio/ip/tcp.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "collab/Result.hpp"
#include "collab/Types.hpp"
#include "collab/core/ConnectionSink.hpp"

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

namespace collab::auth { class SessionAuthenticator; }
namespace collab::core { class CollaborationHub; }
namespace collab::rt   { class ThreadPool; }

namespace collab {

class WebSocketServer;

// One client socket: HTTP upgrade with credential check, then a WebSocket
// read loop feeding the hub. All socket work runs on the stream's strand.
class ClientSession : public core::ConnectionSink,
                      public std::enable_shared_from_this<ClientSession> {
public:
  using tcp = boost::asio::ip::tcp;
  using Ws  = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  // Frames queued beyond this close the connection as a slow consumer.
  static constexpr std::size_t kMaxOutbox = 4096;

  ClientSession(tcp::socket socket,
                WebSocketServer* server,
                core::CollaborationHub* hub,
                const auth::SessionAuthenticator* authenticator,
                rt::ThreadPool* pool,
                bool allowQueryToken);

  // Read the upgrade request and authenticate it.
  void run();

  // ConnectionSink: thread-safe, never blocks.
  void sendText(std::string frame) override;
  void close() override;

  // Server shutdown: close whatever state the session is in.
  void stop() noexcept;

private:
  void doReadRequest();
  void onReadRequest(boost::beast::error_code ec, std::size_t bytes);
  void onAuthenticated(Result<Identity> result);
  void reject(boost::beast::http::status status, const std::string& reason);
  void onAccept(boost::beast::error_code ec);

  void doRead();
  void onRead(boost::beast::error_code ec, std::size_t bytes);

  void doWrite();
  void onWrite(boost::beast::error_code ec, std::size_t bytes);

  // Tell the hub and the server the connection is gone (exactly once).
  void finish();

private:
  WebSocketServer*                  server_{nullptr};
  core::CollaborationHub*           hub_{nullptr};
  const auth::SessionAuthenticator* authenticator_{nullptr};
  rt::ThreadPool*                   pool_{nullptr};
  bool                              allowQueryToken_{true};

  Ws ws_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res_;

  Identity identity_;
  ConnId   connId_{0};

  std::atomic<bool> open_{false};
  std::atomic<bool> finished_{false};

  // Outbound write serialization (the hub sends from pool threads).
  std::deque<std::string> outbox_;
  bool writing_{false};
};

} // namespace collab
