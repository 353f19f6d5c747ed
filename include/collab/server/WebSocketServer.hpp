#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace collab::auth { class SessionAuthenticator; }
namespace collab::core { class CollaborationHub; }
namespace collab::rt   { class ThreadPool; }

namespace collab {

class ClientSession;

class WebSocketServer {
public:
  using tcp = boost::asio::ip::tcp;

  struct Options {
    std::string    address = "0.0.0.0";
    unsigned short port    = 8080; // 0 picks an ephemeral port
    bool           allowQueryToken = true;
  };

  WebSocketServer(boost::asio::io_context& ioc,
                  core::CollaborationHub* hub,
                  const auth::SessionAuthenticator* authenticator,
                  rt::ThreadPool* pool,
                  Options opts);

  // Open, bind, listen and start accepting. False (logged) on failure.
  bool run();

  // Stop accepting new connections (idempotent).
  void stopAccept() noexcept;

  // Close all active sessions (idempotent).
  void closeAll() noexcept;

  unsigned short port() const noexcept { return boundPort_; }

  void registerSession(const std::shared_ptr<ClientSession>& s);
  void unregisterSession(ClientSession* s) noexcept;
  std::size_t sessionCount() const;

private:
  void doAccept();
  void onAccept(boost::beast::error_code ec, tcp::socket socket);

private:
  boost::asio::io_context&          ioc_;
  tcp::acceptor                     acceptor_;
  core::CollaborationHub*           hub_{nullptr};
  const auth::SessionAuthenticator* authenticator_{nullptr};
  rt::ThreadPool*                   pool_{nullptr};
  Options                           opts_;
  unsigned short                    boundPort_{0};

  std::atomic<bool> accepting_{false};

  mutable std::mutex sessions_mu_;
  std::unordered_map<ClientSession*, std::weak_ptr<ClientSession>> sessions_;
};

} // namespace collab
